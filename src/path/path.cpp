/// @file path.cpp
/// @brief Path formatting and parsing

#include <treepath/path/path.hpp>

namespace treepath_path {

using treepath_core::Err;
using treepath_core::MutationError;
using treepath_core::Ok;
using treepath_core::PathError;
using treepath_core::Result;

namespace {

std::string escape_key_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == ']' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

/// Split on '/' outside predicates, honouring escapes inside them
Result<std::vector<std::string>> split_elements(const std::string& text) {
    using Parts = std::vector<std::string>;

    Parts parts;
    std::string buf;
    bool in_key = false;
    bool escaped = false;

    for (char c : text) {
        if (escaped) {
            buf.push_back(c);
            escaped = false;
            continue;
        }
        if (in_key) {
            if (c == '\\') {
                escaped = true;
            } else if (c == ']') {
                in_key = false;
            }
            buf.push_back(c);
            continue;
        }
        if (c == '[') {
            in_key = true;
            buf.push_back(c);
        } else if (c == '/') {
            parts.push_back(buf);
            buf.clear();
        } else {
            buf.push_back(c);
        }
    }
    if (in_key || escaped) {
        return Err<Parts>(PathError::parse(text, "unterminated key predicate"));
    }
    parts.push_back(buf);
    return Ok(std::move(parts));
}

Result<PathElem> parse_elem(const std::string& text, const std::string& whole) {
    std::size_t bracket = text.find('[');
    PathElem elem(text.substr(0, bracket));
    if (elem.name.empty()) {
        return Err<PathElem>(PathError::parse(whole, "empty element name"));
    }

    std::size_t i = bracket;
    while (i != std::string::npos && i < text.size()) {
        if (text[i] != '[') {
            return Err<PathElem>(PathError::parse(whole, "unexpected text after key predicate"));
        }
        std::size_t eq = text.find('=', i);
        if (eq == std::string::npos) {
            return Err<PathElem>(PathError::parse(whole, "key predicate without '='"));
        }
        std::string name = text.substr(i + 1, eq - i - 1);
        if (name.empty()) {
            return Err<PathElem>(PathError::parse(whole, "empty key name"));
        }

        std::string value;
        std::size_t j = eq + 1;
        bool closed = false;
        for (; j < text.size(); ++j) {
            char c = text[j];
            if (c == '\\' && j + 1 < text.size()) {
                value.push_back(text[++j]);
            } else if (c == ']') {
                closed = true;
                break;
            } else {
                value.push_back(c);
            }
        }
        if (!closed) {
            return Err<PathElem>(PathError::parse(whole, "unterminated key predicate"));
        }
        if (!elem.keys.emplace(name, value).second) {
            return Err<PathElem>(PathError::parse(whole, "duplicate key " + name));
        }
        i = j + 1;
    }
    return Ok(std::move(elem));
}

} // anonymous namespace

// =============================================================================
// PathElem
// =============================================================================

std::string PathElem::to_string() const {
    std::string out = name;
    for (const auto& [key, value] : keys) {
        out += "[" + key + "=" + escape_key_value(value) + "]";
    }
    return out;
}

// =============================================================================
// Path
// =============================================================================

Result<Path> Path::parse(const std::string& text) {
    auto parts = split_elements(text);
    if (!parts) {
        return Err<Path>(parts.error());
    }

    Path path;
    const auto& list = *parts;
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (list[i].empty()) {
            // Leading and trailing separators
            if (i == 0 || i + 1 == list.size()) {
                continue;
            }
            return Err<Path>(PathError::parse(text, "empty element"));
        }
        auto elem = parse_elem(list[i], text);
        if (!elem) {
            return Err<Path>(elem.error());
        }
        path.elems.push_back(std::move(elem).value());
    }
    return Ok(std::move(path));
}

Path Path::from_names(const std::vector<std::string>& names) {
    Path path;
    path.elems.reserve(names.size());
    for (const auto& name : names) {
        path.elems.emplace_back(name);
    }
    return path;
}

std::string Path::to_string() const {
    if (elems.empty()) {
        return "/";
    }
    std::string out;
    for (const auto& elem : elems) {
        out += "/";
        out += elem.to_string();
    }
    return out;
}

Path Path::child(PathElem elem) const {
    Path out = *this;
    out.elems.push_back(std::move(elem));
    return out;
}

bool Path::has_prefix(const Path& prefix) const {
    if (prefix.elems.size() > elems.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.elems.size(); ++i) {
        if (prefix.elems[i] != elems[i]) {
            return false;
        }
    }
    return true;
}

Result<Path> join_paths(const Path& prefix, const Path& path) {
    if (!prefix.origin.empty() && !path.origin.empty() && prefix.origin != path.origin) {
        return Err<Path>(MutationError::prefix_join(
            "origin '" + prefix.origin + "' of prefix conflicts with origin '" + path.origin + "'"));
    }

    Path out;
    out.origin = prefix.origin.empty() ? path.origin : prefix.origin;
    out.elems.reserve(prefix.elems.size() + path.elems.size());
    out.elems.insert(out.elems.end(), prefix.elems.begin(), prefix.elems.end());
    out.elems.insert(out.elems.end(), path.elems.begin(), path.elems.end());
    return Ok(std::move(out));
}

} // namespace treepath_path
