#include "sw/bandplan.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sw {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

static bool parse_hz(const std::string& s, int64_t& out) {
    const std::string t = trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(v)) return false;
    // int64 dışı ya da negatif frekans bozuk satır sayılır
    if (v < 0.0 || v >= 9223372036854775808.0) return false;
    out = static_cast<int64_t>(v);
    return true;
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;
    for (size_t i=0; i<line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i+1 < line.size() && line[i+1] == '"') { cur.push_back('"'); ++i; }
                else quoted = false;
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            out.push_back(cur);
            cur.clear();
        } else if (c != '\r') {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::vector<Band> Bandplan::builtin() {
    return {
        {433050000,  434790000,  "ISM/SRD",         "ITU-R1 (EU)", "Short-range devices"},
        {902000000,  928000000,  "ISM",             "US (FCC)",    "902-928 MHz ISM"},
        {2400000000, 2483500000, "ISM",             "Global",      "2.4 GHz ISM"},
        {1420000000, 1427000000, "Radio Astronomy", "Global",      "Hydrogen line"},
        {88000000,   108000000,  "FM Broadcast",    "Global",      "88-108 MHz Radio"},
    };
}

Bandplan::Bandplan() : bands_(builtin()) {}

bool Bandplan::load_csv(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::fprintf(stderr, "[BAND] cannot open %s; using built-in table\n", path.c_str());
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return load_csv_text(ss.str());
}

bool Bandplan::load_csv_text(const std::string& text) {
    std::istringstream in(text);
    std::string line;

    // Başlık: kolonlar isimle bulunur
    if (!std::getline(in, line)) {
        std::fprintf(stderr, "[BAND] empty bandplan; using built-in table\n");
        return false;
    }
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);  // UTF-8 BOM

    int c_low = -1, c_high = -1, c_svc = -1, c_reg = -1, c_notes = -1;
    const auto hdr = split_csv_line(line);
    for (int i=0; i<(int)hdr.size(); ++i) {
        const std::string h = trim(hdr[i]);
        if      (h == "low_hz"  || (h == "f_low_hz"  && c_low  < 0)) c_low  = i;
        else if (h == "high_hz" || (h == "f_high_hz" && c_high < 0)) c_high = i;
        else if (h == "service") c_svc   = i;
        else if (h == "region")  c_reg   = i;
        else if (h == "notes")   c_notes = i;
    }
    if (c_low < 0 || c_high < 0) {
        std::fprintf(stderr, "[BAND] header lacks low_hz/high_hz; using built-in table\n");
        return false;
    }

    auto col = [](const std::vector<std::string>& row, int c) -> std::string {
        return (c >= 0 && c < (int)row.size()) ? trim(row[c]) : std::string();
    };

    std::vector<Band> parsed;
    int skipped = 0;
    int lineno = 1;
    while (std::getline(in, line)) {
        ++lineno;
        if (trim(line).empty()) continue;
        const auto row = split_csv_line(line);
        Band b;
        if (!parse_hz(col(row, c_low), b.low_hz) || !parse_hz(col(row, c_high), b.high_hz)) {
            ++skipped;
            std::fprintf(stderr, "[BAND] line %d: bad bounds, skipped\n", lineno);
            continue;
        }
        b.service = col(row, c_svc);
        b.region  = col(row, c_reg);
        b.notes   = col(row, c_notes);
        parsed.push_back(std::move(b));
    }

    bands_   = std::move(parsed);
    skipped_ = skipped;
    std::printf("[BAND] loaded %zu bands (%d rows skipped)\n", bands_.size(), skipped_);
    return true;
}

BandLabel Bandplan::lookup(int64_t f_hz) const {
    for (const auto& b : bands_) {
        if (b.low_hz <= f_hz && f_hz <= b.high_hz) return {b.service, b.region, b.notes};
    }
    return {};
}

} // namespace sw
