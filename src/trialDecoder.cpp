#include <charconv>
#include <fstream>
#include <sstream>
#include "errors.hpp"
#include "trialDecoder.hpp"

namespace ACC{

    static bool is_blank(char c){
        return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
    }

    bool parse_record(const std::string& line, RawSample& out){
        int c[3];
        const char* p = line.data();
        const char* end = p + line.size();

        for (int i = 0; i < 3; ++i) {
            while (p < end && is_blank(*p)) ++p;
            if (p == end) return false;

            // from_chars rejects a leading '+', accept it like fscanf does
            if (*p == '+' && p + 1 < end && *(p + 1) >= '0' && *(p + 1) <= '9') ++p;
            auto res = std::from_chars(p, end, c[i]);
            if (res.ec != std::errc()) return false;
            p = res.ptr;

            // fields must be separated, "12x" or "1-2" is not a record
            if (p < end && !is_blank(*p)) return false;
        }
        while (p < end && is_blank(*p)) ++p;
        if (p != end) return false;

        out.setCodes(c);
        return true;
    }

    std::vector<RawSample> decode_trial(const std::string& path){
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw IOError(path, "cannot open trial file");
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad()) {
            throw IOError(path, "read failed");
        }
        std::string accum = ss.str();

        std::vector<RawSample> samples;
        std::size_t lineNo = 0;

        // Extract complete lines (the last one may lack its newline)
        std::size_t start = 0;
        while (start < accum.size()) {
            std::size_t pos = accum.find('\n', start);
            if (pos == std::string::npos) pos = accum.size();

            std::string line = accum.substr(start, pos - start);
            start = pos + 1;
            ++lineNo;

            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t\v\f") == std::string::npos) continue;

            RawSample sample;
            if (!parse_record(line, sample)) {
                throw FormatError(path, lineNo, "expected three integers, got \"" + line + "\"");
            }
            samples.push_back(sample);
        }
        return samples;
    }
}
