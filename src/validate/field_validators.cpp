#include "sblint/field_validators.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace sblint {

namespace {

bool is_non_empty_string(const Value& v) {
    return v.is_string() && !v.as_string().empty();
}

bool is_non_empty_string_list(const Value& v) {
    if (!v.is_sequence() || v.as_sequence().empty()) {
        return false;
    }
    for (const auto& item : v.as_sequence()) {
        if (!is_non_empty_string(item)) {
            return false;
        }
    }
    return true;
}

bool is_string_map(const Value& v) {
    if (!v.is_mapping() || v.as_mapping().empty()) {
        return false;
    }
    for (const auto& entry : v.as_mapping()) {
        if (!entry.value.is_string()) {
            return false;
        }
    }
    return true;
}

// Lists of names at the leaves, mappings of arbitrary depth above them
bool is_distro_pkg_shape(const Value& v) {
    if (v.is_sequence()) {
        return is_non_empty_string_list(v);
    }
    if (!v.is_mapping() || v.as_mapping().empty()) {
        return false;
    }
    for (const auto& entry : v.as_mapping()) {
        if (!is_distro_pkg_shape(entry.value)) {
            return false;
        }
    }
    return true;
}

const std::set<std::string>& categories() {
    // https://specifications.freedesktop.org/menu-spec/latest/category-registry.html
    static const std::set<std::string> registered = {
        // Main categories
        "AudioVideo", "Audio", "Video", "Development", "Education", "Game",
        "Graphics", "Network", "Office", "Science", "Settings", "System",
        "Utility",
        // Additional categories
        "Building", "Debugger", "IDE", "GUIDesigner", "Profiling",
        "RevisionControl", "Translation", "Calendar", "ContactManagement",
        "Database", "Dictionary", "Chart", "Email", "Finance", "FlowChart",
        "PDA", "ProjectManagement", "Presentation", "Spreadsheet",
        "WordProcessor", "2DGraphics", "VectorGraphics", "RasterGraphics",
        "3DGraphics", "Scanning", "OCR", "Photography", "Publishing", "Viewer",
        "TextTools", "DesktopSettings", "HardwareSettings", "Printing",
        "PackageManager", "Dialup", "InstantMessaging", "Chat", "IRCClient",
        "Feed", "FileTransfer", "HamRadio", "News", "P2P", "RemoteAccess",
        "Telephony", "TelephonyTools", "VideoConference", "WebBrowser",
        "WebDevelopment", "Midi", "Mixer", "Sequencer", "Tuner", "TV",
        "AudioVideoEditing", "Player", "Recorder", "DiscBurning",
        "ActionGame", "AdventureGame", "ArcadeGame", "BoardGame", "BlocksGame",
        "CardGame", "KidsGame", "LogicGame", "RolePlaying", "Shooter",
        "Simulation", "SportsGame", "StrategyGame", "Art", "Construction",
        "Music", "Languages", "ArtificialIntelligence", "Astronomy", "Biology",
        "Chemistry", "ComputerScience", "DataVisualization", "Economy",
        "Electricity", "Geography", "Geology", "Geoscience", "History",
        "Humanities", "ImageProcessing", "Literature", "Maps", "Math",
        "NumericalAnalysis", "MedicalSoftware", "Physics", "Robotics",
        "Spirituality", "Sports", "ParallelComputing", "Amusement",
        "Archiving", "Compression", "Electronics", "Emulator", "Engineering",
        "FileTools", "FileManager", "TerminalEmulator", "Filesystem",
        "Monitor", "Security", "Accessibility", "Calculator", "Clock",
        "TextEditor", "Documentation", "Adult", "Core", "KDE", "GNOME", "XFCE",
        "DDE", "GTK", "Qt", "Motif", "Java", "ConsoleOnly",
    };
    return registered;
}

} // anonymous namespace

// ============================================================================
// Shape validators
// ============================================================================

namespace shapes {

std::optional<Value> boolean(const std::string& name, const Value& value,
                             DiagnosticStore& sink, std::size_t line, bool required) {
    if (!value.is_boolean()) {
        sink.record(name, "'" + name + "' must be a boolean.", line, shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> string(const std::string& name, const Value& value,
                            DiagnosticStore& sink, std::size_t line, bool required) {
    if (!is_non_empty_string(value)) {
        sink.record(name, "'" + name + "' must be a non-empty string.", line,
                    shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> string_list(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required) {
    if (!is_non_empty_string_list(value)) {
        sink.record(name, "'" + name + "' must be a non-empty list of strings.", line,
                    shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> text_or_map(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required) {
    if (is_non_empty_string(value) || is_string_map(value)) {
        return value;
    }
    sink.record(name, "'" + name + "' must be a string or a mapping of strings.", line,
                shape_severity(required));
    return std::nullopt;
}

std::optional<Value> resource(const std::string& name, const Value& value,
                              DiagnosticStore& sink, std::size_t line, bool required) {
    if (is_non_empty_string(value)) {
        return value;
    }
    if (value.is_mapping()) {
        static const char* const kinds[] = {"url", "file", "dir"};
        std::size_t found = 0;
        for (const char* kind : kinds) {
            if (const Value* v = value.find(kind)) {
                if (!is_non_empty_string(*v)) {
                    sink.record(name + "." + kind,
                                "'" + name + "." + kind + "' must be a non-empty string.",
                                line, shape_severity(required));
                    return std::nullopt;
                }
                ++found;
            }
        }
        if (found == 1) {
            return value;
        }
    }
    sink.record(name, "'" + name + "' must be a string or a mapping with one of url, file, dir.",
                line, shape_severity(required));
    return std::nullopt;
}

std::optional<Value> license(const std::string& name, const Value& value,
                             DiagnosticStore& sink, std::size_t line, bool required) {
    if (is_non_empty_string(value)) {
        return value;
    }
    bool ok = value.is_sequence() && !value.as_sequence().empty();
    if (ok) {
        for (const auto& item : value.as_sequence()) {
            if (is_non_empty_string(item)) {
                continue;
            }
            const Value* id = item.find("id");
            if (!id || !is_non_empty_string(*id)) {
                ok = false;
                break;
            }
            for (const auto& entry : item.as_mapping()) {
                if (entry.key != "id" && entry.key != "file" && entry.key != "url") {
                    sink.record(name + "." + entry.key,
                                "'" + name + "." + entry.key + "' is not a valid field.", line,
                                Severity::Warn);
                } else if (!entry.value.is_string()) {
                    ok = false;
                }
            }
        }
    }
    if (!ok) {
        sink.record(name, "'" + name + "' must be a string or a list of licenses "
                    "(string or mapping with 'id').", line, shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> build_asset(const std::string& name, const Value& value,
                                 DiagnosticStore& sink, std::size_t line, bool required) {
    bool ok = value.is_sequence() && !value.as_sequence().empty();
    if (ok) {
        for (const auto& item : value.as_sequence()) {
            const Value* url = item.find("url");
            const Value* out = item.find("out");
            if (!url || !out || !is_non_empty_string(*url) || !is_non_empty_string(*out)) {
                ok = false;
                break;
            }
        }
    }
    if (!ok) {
        sink.record(name, "'" + name + "' must be a list of mappings with 'url' and 'out'.",
                    line, shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> distro_pkg(const std::string& name, const Value& value,
                                DiagnosticStore& sink, std::size_t line, bool required) {
    if (!is_distro_pkg_shape(value)) {
        sink.record(name, "'" + name + "' must be a list of package names or a mapping "
                    "of distributions to package lists.", line, shape_severity(required));
        return std::nullopt;
    }
    return value;
}

std::optional<Value> x_exec(const std::string& name, const Value& value,
                            DiagnosticStore& sink, std::size_t line, bool required) {
    if (!value.is_mapping()) {
        sink.record(name, "'" + name + "' must be a mapping.", line, shape_severity(required));
        return std::nullopt;
    }

    static const std::set<std::string> string_fields = {"shell", "run", "pkgver", "entrypoint"};
    static const std::set<std::string> list_fields = {"arch", "os", "host", "conflicts", "depends"};
    static const char* const mandatory[] = {"shell", "run"};

    bool ok = true;
    for (const auto& entry : value.as_mapping()) {
        std::string path = name + "." + entry.key;
        if (string_fields.count(entry.key)) {
            if (!is_non_empty_string(entry.value)) {
                sink.record(path, "'" + path + "' must be a non-empty string.", line,
                            Severity::Error);
                ok = false;
            }
        } else if (list_fields.count(entry.key)) {
            if (!is_non_empty_string_list(entry.value)) {
                sink.record(path, "'" + path + "' must be a non-empty list of strings.", line,
                            Severity::Error);
                ok = false;
            }
        } else {
            sink.record(path, "'" + path + "' is not a valid field.", line, Severity::Warn);
        }
    }

    for (const char* field : mandatory) {
        if (!value.find(field)) {
            std::string path = name + "." + field;
            sink.record(path, "Missing required field: " + path, line, Severity::Error);
            ok = false;
        }
    }

    if (!ok) {
        return std::nullopt;
    }
    return value;
}

} // namespace shapes

// ============================================================================
// Registry
// ============================================================================

const std::vector<FieldValidator>& field_validators() {
    static const std::vector<FieldValidator> registry = {
        {"_disabled", true, shapes::boolean},
        {"_disabled_reason", false, shapes::text_or_map},
        {"pkg", true, shapes::string},
        {"pkg_id", false, shapes::string},
        {"app_id", false, shapes::string},
        {"pkg_type", false, shapes::string},
        {"build_util", false, shapes::string_list},
        {"build_asset", false, shapes::build_asset},
        {"category", false, shapes::string_list},
        {"description", true, shapes::text_or_map},
        {"desktop", false, shapes::resource},
        {"distro_pkg", false, shapes::distro_pkg},
        {"homepage", false, shapes::string_list},
        {"icon", false, shapes::resource},
        {"license", false, shapes::license},
        {"maintainer", false, shapes::string_list},
        {"note", false, shapes::string_list},
        {"provides", false, shapes::string_list},
        {"repology", false, shapes::string_list},
        {"src_url", true, shapes::string_list},
        {"tag", false, shapes::string_list},
        {"x_exec", true, shapes::x_exec},
    };
    return registry;
}

const FieldValidator* find_field_validator(const std::vector<FieldValidator>& registry,
                                           const std::string& name) {
    for (const auto& validator : registry) {
        if (name == validator.name) {
            return &validator;
        }
    }
    return nullptr;
}

// ============================================================================
// Value predicates
// ============================================================================

bool is_valid_alpha(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '_' || c == '.';
    });
}

bool is_valid_url(const std::string& value) {
    auto sep = value.find("://");
    if (sep == std::string::npos || sep == 0) {
        return false;
    }

    std::string scheme = value.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (unsigned char c : scheme) {
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }

    for (unsigned char c : value) {
        if (std::isspace(c) || std::iscntrl(c)) {
            return false;
        }
    }

    std::string rest = value.substr(sep + 3);
    auto authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);

    // Strip userinfo and port
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (!authority.empty() && authority.front() != '[') {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            std::string port = authority.substr(colon + 1);
            if (!std::all_of(port.begin(), port.end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                return false;
            }
            authority = authority.substr(0, colon);
        }
    }
    return !authority.empty();
}

bool is_valid_category(const std::string& value) {
    return categories().count(value) > 0;
}

const std::vector<std::string>& valid_pkg_types() {
    static const std::vector<std::string> types = {
        "appbundle", "appimage", "archive", "dynamic", "flatimage",
        "gameimage", "nixappimage", "runimage", "static",
    };
    return types;
}

bool is_valid_pkg_type(const std::string& value) {
    const auto& types = valid_pkg_types();
    return std::find(types.begin(), types.end(), value) != types.end();
}

} // namespace sblint
