#pragma once

#include "gff/gff.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace gff::easy {

namespace detail {
// Path steps are separated by '\' (as in patcher field paths) or '/'.
inline std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '\\' || c == '/') {
            if (!cur.empty()) parts.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(std::move(cur));
    return parts;
}

inline std::size_t parse_index(const std::string& step, const std::string& path) {
    if (step.empty() || step.find_first_not_of("0123456789") != std::string::npos) {
        throw GffError(ErrorKind::TypeMismatch, "list step '" + step + "' in '" + path + "' is not an index");
    }
    // No list holds more than 2^32 entries.
    if (step.size() > 10) {
        throw GffError(ErrorKind::NotFound, "list index " + step + " out of range in '" + path + "'");
    }
    return static_cast<std::size_t>(std::stoull(step));
}
} // namespace detail

/// Resolve a path such as "Inner\\Entries\\0\\Value" to a field. Decimal steps
/// index into lists.
inline const GffField& find_field(const GffStruct& root, const std::string& path) {
    const std::vector<std::string> steps = detail::split_path(path);
    if (steps.empty()) {
        throw GffError(ErrorKind::NotFound, "empty field path");
    }

    const GffStruct* cur = &root;
    const GffField* field = nullptr;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (field) {
            if (field->type() == GffFieldType::Struct) {
                cur = &std::get<GffStruct>(field->value);
            } else if (field->type() == GffFieldType::List) {
                const auto& list = std::get<GffList>(field->value);
                std::size_t idx = detail::parse_index(steps[i], path);
                if (idx >= list.size()) {
                    throw GffError(ErrorKind::NotFound, "list index " + steps[i] + " out of range in '" + path + "'");
                }
                cur = &list[idx];
                if (++i == steps.size()) {
                    throw GffError(ErrorKind::TypeMismatch, "'" + path + "' names a list entry, not a field");
                }
            } else {
                throw GffError(ErrorKind::TypeMismatch,
                               "'" + field->label() + "' in '" + path + "' is " + to_string(field->type()) +
                               ", not a struct or list");
            }
        }
        field = cur->field(steps[i]);
        if (!field) {
            throw GffError(ErrorKind::NotFound, "field '" + steps[i] + "' not found in '" + path + "'");
        }
    }
    return *field;
}

/// Struct at a path: a Struct field or a list entry ("Entries\\2"). An empty
/// path returns `root`.
inline const GffStruct& find_struct(const GffStruct& root, const std::string& path) {
    std::vector<std::string> steps = detail::split_path(path);
    if (steps.empty()) return root;

    // A trailing index under a List field selects an entry; under a Struct
    // field it is an ordinary label.
    const std::string& last = steps.back();
    if (!last.empty() && last.find_first_not_of("0123456789") == std::string::npos && steps.size() >= 2) {
        std::string list_path;
        for (std::size_t i = 0; i + 1 < steps.size(); ++i) {
            if (i) list_path += '\\';
            list_path += steps[i];
        }
        const GffField& parent = find_field(root, list_path);
        if (parent.type() == GffFieldType::List) {
            const auto& list = std::get<GffList>(parent.value);
            std::size_t idx = detail::parse_index(last, path);
            if (idx >= list.size()) {
                throw GffError(ErrorKind::NotFound, "list index " + last + " out of range in '" + path + "'");
            }
            return list[idx];
        }
    }

    const GffField& f = find_field(root, path);
    if (f.type() != GffFieldType::Struct) {
        throw GffError(ErrorKind::TypeMismatch, "'" + path + "' is " + to_string(f.type()) + ", not a struct");
    }
    return std::get<GffStruct>(f.value);
}

inline LocalizedString make_locstring(std::int32_t stringref) {
    return LocalizedString(stringref);
}

inline LocalizedString make_locstring(const std::string& english, Gender gender = Gender::Male) {
    LocalizedString loc;
    loc.set(Language::English, gender, english);
    return loc;
}

/// Append a struct to a list and return it for filling in.
inline GffStruct& append_struct(GffList& list, std::int32_t type_id) {
    list.emplace_back(type_id);
    return list.back();
}

} // namespace gff::easy
