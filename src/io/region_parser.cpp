#include "io/region_parser.hpp"
#include "io/fai_index.hpp"
#include "util/number_parser.hpp"

#include <cctype>

namespace fastaseek {

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        start++;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        end--;
    return s.substr(start, end - start);
}

// Split on runs of tabs/spaces
static std::vector<std::string> split_ws(const std::string& line) {
    std::vector<std::string> fields;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == '\t' || line[i] == ' '))
            i++;
        if (i >= line.size()) break;
        size_t j = i;
        while (j < line.size() && line[j] != '\t' && line[j] != ' ')
            j++;
        fields.push_back(line.substr(i, j - i));
        i = j;
    }
    return fields;
}

bool parse_region(const std::string& str, const FaiIndex* index,
                  Region& out, std::string& error_msg) {
    out = Region();
    std::string s = trim(str);
    if (s.empty()) {
        error_msg = "Error: empty region";
        return false;
    }

    // Exact sequence name wins over coordinate syntax (names may contain ':')
    if (index && index->lookup(s)) {
        out.name = s;
        return true;
    }

    auto colon = s.rfind(':');
    if (colon == std::string::npos) {
        out.name = s;
        return true;
    }

    out.name = s.substr(0, colon);
    std::string coords = s.substr(colon + 1);
    if (out.name.empty()) {
        error_msg = "Error: missing sequence name in region '" + s + "'";
        return false;
    }

    std::string start_str = coords;
    std::string end_str;
    auto dash = coords.find('-');
    if (dash != std::string::npos) {
        start_str = coords.substr(0, dash);
        end_str = coords.substr(dash + 1);
    }

    uint64_t start1 = 0;
    if (!parse_u64(start_str, start1, true) || start1 == 0) {
        error_msg = "Error: invalid start in region '" + s + "'";
        return false;
    }
    out.whole = false;
    out.start = start1 - 1;

    if (dash == std::string::npos || end_str.empty()) {
        // "name:start" and "name:start-" run to the end of the sequence
        out.to_end = true;
        return true;
    }

    uint64_t end1 = 0;
    if (!parse_u64(end_str, end1, true)) {
        error_msg = "Error: invalid end in region '" + s + "'";
        return false;
    }
    out.to_end = false;
    out.stop = end1;
    return true;
}

bool parse_region_list(std::istream& in, const FaiIndex* index,
                       std::vector<Region>& out, std::string& error_msg) {
    std::string line;
    while (std::getline(in, line)) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;

        Region r;
        if (!parse_region(s, index, r, error_msg)) return false;
        out.push_back(std::move(r));
    }
    return true;
}

bool parse_bed(std::istream& in, std::vector<Region>& out,
               std::string& error_msg) {
    std::string line;
    uint64_t lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.compare(0, 5, "track") == 0 || s.compare(0, 7, "browser") == 0)
            continue;

        auto fields = split_ws(s);
        if (fields.size() < 3) {
            error_msg = "Error: BED line " + std::to_string(lineno)
                      + ": expected at least 3 columns";
            return false;
        }

        Region r;
        r.name = fields[0];
        if (!parse_u64(fields[1], r.start) || !parse_u64(fields[2], r.stop)) {
            error_msg = "Error: BED line " + std::to_string(lineno)
                      + ": invalid coordinates";
            return false;
        }
        r.to_end = false;
        r.whole = false;
        if (fields.size() >= 4 && fields[3] != ".") r.label = fields[3];
        if (fields.size() >= 6) r.reverse = (fields[5] == "-");
        out.push_back(std::move(r));
    }
    return true;
}

std::string region_display_name(const Region& r) {
    std::string id;
    if (!r.label.empty()) {
        id = r.label;
    } else if (r.whole) {
        id = r.name;
    } else if (r.to_end) {
        id = r.name + ":" + std::to_string(r.start + 1) + "-";
    } else {
        id = r.name + ":" + std::to_string(r.start + 1) + "-" + std::to_string(r.stop);
    }
    if (r.reverse) id += "/rc";
    return id;
}

} // namespace fastaseek
