#include "sblint/distro_pkg.hpp"

namespace sblint {

std::optional<DistroPkg> DistroPkg::from_value(const Value& value) {
    if (value.is_sequence()) {
        if (!value.is_string_sequence()) {
            return std::nullopt;
        }
        List names;
        for (const auto& item : value.as_sequence()) {
            names.push_back(item.as_string());
        }
        return DistroPkg{std::move(names)};
    }

    if (value.is_mapping()) {
        InnerNode children;
        for (const auto& entry : value.as_mapping()) {
            auto child = from_value(entry.value);
            if (!child) {
                return std::nullopt;
            }
            children.push_back(DistroPkgEntry{entry.key, std::move(*child)});
        }
        return DistroPkg{std::move(children)};
    }

    return std::nullopt;
}

void DuplicateChecker::check_duplicate_values(const std::vector<std::string>& list,
                                              const std::string& field_path,
                                              std::size_t line) {
    std::unordered_set<std::string> seen;
    for (const auto& item : list) {
        if (!seen.insert(item).second) {
            sink_.record(field_path,
                         "Duplicate value '" + item + "' found in " + field_path,
                         line, Severity::Error);
        }
    }
}

void DuplicateChecker::check_distro_pkg_duplicates(const DistroPkg& node,
                                                   const std::string& field_path,
                                                   std::size_t line) {
    if (node.is_list()) {
        check_duplicate_values(node.list(), field_path, line);
        return;
    }

    for (const auto& child : node.children()) {
        std::string path = field_path.empty() ? child.key : field_path + "." + child.key;

        if (!visited_.insert(path).second) {
            sink_.record(path, "'" + path + "' field is duplicated", line, Severity::Error);
            continue;
        }

        if (child.value.is_list()) {
            check_duplicate_values(child.value.list(), path, line);
        } else {
            check_distro_pkg_duplicates(child.value, path, line);
        }
    }
}

} // namespace sblint
