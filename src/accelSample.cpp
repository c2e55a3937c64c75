#include <iostream>
#include "accelSample.hpp"

namespace ACC{

    RawSample::RawSample(int x, int y, int z) : codes{x, y, z} {}

    void RawSample::setCodes(const int c[3]){
        for (int i = 0; i < 3; ++i) {
            codes[i] = c[i];
        }
    }
    int RawSample::getX() const {
        return codes[0];
    }
    int RawSample::getY() const {
        return codes[1];
    }
    int RawSample::getZ() const {
        return codes[2];
    }

    bool operator==(const RawSample& a, const RawSample& b){
        return a.codes[0] == b.codes[0] && a.codes[1] == b.codes[1] && a.codes[2] == b.codes[2];
    }

    std::ostream& operator<<(std::ostream& os, const RawSample& sample){
        os << "raw = [" << sample.codes[0] << ", " << sample.codes[1] << ", " << sample.codes[2] << "]";
        return os;
    }

    PhysicalSample::PhysicalSample(double x, double y, double z) : acc{x, y, z} {}

    void PhysicalSample::setAcc(const double a[3]){
        for (int i = 0; i < 3; i++){
            acc[i] = a[i];
        }
    }
    double PhysicalSample::getX() const {
        return acc[0];
    }
    double PhysicalSample::getY() const {
        return acc[1];
    }
    double PhysicalSample::getZ() const {
        return acc[2];
    }
    const double* PhysicalSample::getAcc() const {
        return acc;
    }

    std::ostream& operator<<(std::ostream& os, const PhysicalSample& sample){
        os << "acc = [" << sample.acc[0] << ", " << sample.acc[1] << ", " << sample.acc[2] << "] m/s^2";
        return os;
    }
}
