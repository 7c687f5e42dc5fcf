/**
 * @file Path.cpp
 * @brief Path grammar implementation
 */

#include "treepatch/Path.hpp"
#include "treepatch/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace treepatch {

namespace {

bool is_separator(char c) {
    return c == KEY_SEPARATOR || c == INDEX_SEPARATOR;
}

/**
 * @brief Check an index segment: digits without leading zero, or -, +, *
 */
bool parse_index(const std::string& raw, Segment& seg) {
    if (raw == "-") {
        seg.selector = Segment::Selector::Last;
        return true;
    }
    if (raw == "+") {
        seg.selector = Segment::Selector::Append;
        return true;
    }
    if (raw == "*") {
        seg.selector = Segment::Selector::Prepend;
        return true;
    }

    if (raw.empty()) return false;
    if (raw[0] == '0' && raw.size() > 1) return false;
    if (!std::all_of(raw.begin(), raw.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }

    std::size_t value = 0;
    for (char c : raw) {
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }

    seg.selector = Segment::Selector::Position;
    seg.position = value;
    return true;
}

} // anonymous namespace

std::string Segment::key() const {
    return unescape_key(raw);
}

Result Path::parse(const std::string& text, Path& out) {
    if (text.empty()) {
        return Result::failure(Status::BadRequest, "empty path");
    }
    if (!is_separator(text.front())) {
        return Result::failure(Status::BadRequest,
                               "path must start with '/' or ':'");
    }
    if (is_separator(text.back())) {
        return Result::failure(Status::BadRequest,
                               "path must not end with a separator");
    }

    // escapes are only checked here; keys are decoded when consumed
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '~') continue;
        if (i + 1 >= text.size() || text[i + 1] < '0' || text[i + 1] > '2') {
            return Result::failure(Status::BadRequest, "invalid escape sequence");
        }
    }

    std::vector<Segment> segments;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char sep = text[pos];
        std::size_t end = pos + 1;
        while (end < text.size() && !is_separator(text[end])) {
            ++end;
        }

        Segment seg;
        seg.raw = text.substr(pos + 1, end - pos - 1);
        if (sep == INDEX_SEPARATOR) {
            seg.kind = Segment::Kind::Index;
            if (!parse_index(seg.raw, seg)) {
                return Result::failure(Status::BadRequest,
                                       "invalid index '" + seg.raw + "'");
            }
        } else {
            seg.kind = Segment::Kind::Key;
        }
        segments.push_back(std::move(seg));
        pos = end;
    }

    out.text_ = text;
    out.segments_ = std::move(segments);
    return Result::success();
}

Path parse_path(const std::string& text) {
    Path path;
    Result r = Path::parse(text, path);
    if (r.failed()) {
        throw PathError(text, r.message());
    }
    return path;
}

bool is_valid_path(const std::string& text) {
    Path path;
    return Path::parse(text, path).ok();
}

std::string unescape_key(const std::string& raw) {
    if (raw.find('~') == std::string::npos) {
        return raw;
    }

    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '~' && i + 1 < raw.size()) {
            switch (raw[i + 1]) {
                case '0': out += '~'; ++i; continue;
                case '1': out += '/'; ++i; continue;
                case '2': out += ':'; ++i; continue;
                default: break;
            }
        }
        out += raw[i];
    }
    return out;
}

std::string escape_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        switch (c) {
            case '~': out += "~0"; break;
            case '/': out += "~1"; break;
            case ':': out += "~2"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string join_child(const std::string& parent, char separator,
                       const std::string& child) {
    std::string out = parent;
    out += separator;
    out += (separator == KEY_SEPARATOR) ? escape_key(child) : child;
    return out;
}

} // namespace treepatch
