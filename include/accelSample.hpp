#pragma once

#include <iostream>

namespace ACC{

    // One record of a trial file: device ADC codes, nominally 0..63.
    class RawSample {
    public:
        RawSample() = default;
        RawSample(int x, int y, int z);

        void setCodes(const int c[3]);

        int getX() const;
        int getY() const;
        int getZ() const;

        friend bool operator==(const RawSample& a, const RawSample& b);
        friend std::ostream& operator<<(std::ostream& os, const RawSample& sample);

    private:
        int codes[3]{};
    };

    // Acceleration in m/s^2.
    class PhysicalSample {
    public:
        PhysicalSample() = default;
        PhysicalSample(double x, double y, double z);

        void setAcc(const double a[3]);

        double getX() const;
        double getY() const;
        double getZ() const;
        const double* getAcc() const;

        friend std::ostream& operator<<(std::ostream& os, const PhysicalSample& sample);

    private:
        double acc[3]{};
    };
}
