#include "unitConverter.hpp"

namespace ACC{

    PhysicalSample convert(const RawSample& raw){
        return PhysicalSample(to_physical(raw.getX()),
                              to_physical(raw.getY()),
                              to_physical(raw.getZ()));
    }

    Trial convert_trial(const std::vector<RawSample>& raw, const std::string& source){
        Trial t;
        t.source = source;
        t.x.reserve(raw.size());
        t.y.reserve(raw.size());
        t.z.reserve(raw.size());

        for (const auto& s : raw) {
            const PhysicalSample p = convert(s);
            t.x.push_back(p.getX());
            t.y.push_back(p.getY());
            t.z.push_back(p.getZ());
        }
        return t;
    }
}
