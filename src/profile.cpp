#include "profile.hpp"

#include "log.hpp"
#include "path_utils.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <json/json.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <chrono>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace profile {

namespace {

constexpr std::string_view kProfilePrefix = "ffprof_";
constexpr std::string_view kPrefPrefix = "user_pref(";
constexpr int kMaxNameAttempts = 100;

constexpr std::string_view kRdfNamespace = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
constexpr std::string_view kEmNamespace = "http://www.mozilla.org/2004/em-rdf#";

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&::xmlFreeDoc)>;

[[nodiscard]] bool is_element(const xmlNode* node, const std::string_view name, const std::string_view ns) {
    return node->type == XML_ELEMENT_NODE
        && node->ns != nullptr
        && node->ns->href != nullptr
        && name == reinterpret_cast<const char*>(node->name)
        && ns == reinterpret_cast<const char*>(node->ns->href);
}

[[nodiscard]] std::string node_text(const xmlNode* node) {
    xmlChar* content = ::xmlNodeGetContent(node);
    if (!content) {
        return {};
    }
    std::string text(reinterpret_cast<const char*>(content));
    ::xmlFree(content);
    return text;
}

[[nodiscard]] std::expected<fs::path, std::error_code> make_temp_directory() {
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return std::unexpected(ec);
    }

    constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device seed;
    std::mt19937 generator(seed());
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);

    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        std::string name(kProfilePrefix);
        for (int i = 0; i < 8; ++i) {
            name.push_back(alphabet[pick(generator)]);
        }

        const fs::path candidate = base / name;
        if (fs::create_directory(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            return std::unexpected(ec);
        }
    }
    return std::unexpected(std::make_error_code(std::errc::file_exists));
}

std::expected<void, std::error_code> apply_template(const fs::path& profile, const fs::path& template_dir) {
    logging::debug("using profile template: '{}'", template_dir.string());
    if (!utils::is_directory(template_dir)) {
        logging::error("Cannot find template profile: '{}'", template_dir.string());
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::error_code ec;
    fs::copy(template_dir, profile, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(ec);
    }

    // A copied Invalidprefs.js would make the browser discard prefs.js.
    fs::remove(profile / "Invalidprefs.js", ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

std::expected<void, std::error_code> install_prefs(const fs::path& profile, const fs::path& prefs_js) {
    logging::debug("using prefs.js: '{}'", prefs_js.string());
    if (!utils::is_regular_file(prefs_js)) {
        logging::error("prefs.js file does not exist: '{}'", prefs_js.string());
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::error_code ec;
    fs::copy_file(prefs_js, profile / "prefs.js", fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return std::unexpected(ec);
    }

    // times.json is only needed alongside a custom prefs.js.
    const fs::path times_json = profile / "times.json";
    if (utils::is_regular_file(times_json)) {
        return {};
    }

    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const long long created = std::chrono::duration_cast<std::chrono::seconds>(now).count() * 1000;
    std::ofstream times(times_json, std::ios::trunc);
    times << fmt::format("{{\"created\":{}}}", created);
    if (!times) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

std::expected<void, std::error_code> install_extensions(const fs::path& profile,
                                                        const std::vector<fs::path>& extensions) {
    if (extensions.empty()) {
        return {};
    }

    const fs::path extension_dir = profile / "extensions";
    std::error_code ec;
    fs::create_directories(extension_dir, ec);
    if (ec) {
        return std::unexpected(ec);
    }

    for (const fs::path& extension : extensions) {
        if (utils::is_regular_file(extension) && extension.extension() == ".xpi") {
            fs::copy_file(extension, extension_dir / extension.filename(), fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return std::unexpected(ec);
            }
            continue;
        }

        if (utils::is_directory(extension)) {
            const auto id = detail::read_extension_id(extension);
            if (!id) {
                logging::error("Failed to find extension id in manifest: '{}'", extension.string());
                return std::unexpected(std::make_error_code(std::errc::invalid_argument));
            }

            const fs::path source = fs::absolute(extension, ec);
            if (ec) {
                return std::unexpected(ec);
            }
            fs::copy(source, extension_dir / *id, fs::copy_options::recursive, ec);
            if (ec) {
                return std::unexpected(ec);
            }
            continue;
        }

        logging::error("Unknown extension: '{}'", extension.string());
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    return {};
}

std::expected<void, std::error_code> populate(const fs::path& profile, const ProfileOptions& options) {
    if (options.templateDir) {
        if (auto result = apply_template(profile, *options.templateDir); !result) {
            return result;
        }
    }

    if (options.prefsJs) {
        if (auto result = install_prefs(profile, *options.prefsJs); !result) {
            return result;
        }
    }

    return install_extensions(profile, options.extensions);
}

[[nodiscard]] std::expected<std::set<std::string>, std::error_code> read_pref_names(const fs::path& prefs) {
    std::ifstream input(prefs);
    if (!input) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }

    std::set<std::string> names;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.starts_with(kPrefPrefix)) {
            continue;
        }
        names.insert(line.substr(0, line.find(',')));
    }
    return names;
}

void grant_owner_write(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);
    if (ec) {
        logging::debug("Cannot change permissions of '{}' ({})", path.string(), ec.message());
    }
}

} // namespace

namespace detail {

std::optional<std::string> read_manifest_json_id(const fs::path& manifest) {
    std::ifstream input(manifest);
    if (!input) {
        return std::nullopt;
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, input, &root, &errors)) {
        logging::debug("Failed to parse manifest.json: {}", errors);
        return std::nullopt;
    }

    const Json::Value* node = &root;
    for (const char* key : {"applications", "gecko", "id"}) {
        if (!node->isObject() || !node->isMember(key)) {
            logging::debug("Failed to parse manifest.json: missing '{}'", key);
            return std::nullopt;
        }
        node = &(*node)[key];
    }

    if (!node->isString() || node->asString().empty()) {
        return std::nullopt;
    }
    return node->asString();
}

std::optional<std::string> read_install_rdf_id(const fs::path& manifest) {
    const std::string path = manifest.string();
    XmlDocPtr document(::xmlReadFile(path.c_str(), nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                       &::xmlFreeDoc);
    if (!document) {
        logging::debug("Failed to parse install.rdf: '{}'", path);
        return std::nullopt;
    }

    const xmlNode* root = ::xmlDocGetRootElement(document.get());
    if (!root || !is_element(root, "RDF", kRdfNamespace)) {
        logging::debug("Failed to parse install.rdf: root is not rdf:RDF");
        return std::nullopt;
    }

    // Only Description/em:id directly below the root, and exactly one of them.
    std::vector<std::string> ids;
    for (const xmlNode* description = root->children; description; description = description->next) {
        if (!is_element(description, "Description", kRdfNamespace)) {
            continue;
        }
        for (const xmlNode* child = description->children; child; child = child->next) {
            if (is_element(child, "id", kEmNamespace)) {
                ids.push_back(node_text(child));
            }
        }
    }

    if (ids.size() != 1) {
        logging::debug("Failed to parse install.rdf: found {} em:id entries", ids.size());
        return std::nullopt;
    }
    if (ids.front().empty()) {
        return std::nullopt;
    }
    return ids.front();
}

std::optional<std::string> read_extension_id(const fs::path& extension_dir) {
    if (const fs::path manifest = extension_dir / "manifest.json"; utils::is_regular_file(manifest)) {
        return read_manifest_json_id(manifest);
    }
    if (const fs::path manifest = extension_dir / "install.rdf"; utils::is_regular_file(manifest)) {
        return read_install_rdf_id(manifest);
    }
    return std::nullopt;
}

} // namespace detail

std::expected<fs::path, std::error_code> create_profile(const ProfileOptions& options) {
    auto profile = make_temp_directory();
    if (!profile) {
        return profile;
    }
    logging::debug("profile directory: '{}'", profile->string());

    if (auto populated = populate(*profile, options); !populated) {
        if (auto removed = remove_tree(*profile); !removed) {
            logging::warning("Failed to remove '{}' ({})", profile->string(), removed.error().message());
        }
        return std::unexpected(populated.error());
    }
    return profile;
}

std::expected<bool, std::error_code> check_prefs(const fs::path& profile_prefs, const fs::path& input_prefs) {
    for (const fs::path& prefs : {input_prefs, profile_prefs}) {
        if (!utils::is_regular_file(prefs)) {
            logging::error("Cannot find '{}'", prefs.string());
            return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
    }

    const auto profile_names = read_pref_names(profile_prefs);
    if (!profile_names) {
        return std::unexpected(profile_names.error());
    }
    const auto input_names = read_pref_names(input_prefs);
    if (!input_names) {
        return std::unexpected(input_names.error());
    }

    std::vector<std::string> missing;
    for (const std::string& name : *input_names) {
        if (!profile_names->contains(name)) {
            missing.push_back(name.substr(kPrefPrefix.size()));
        }
    }

    if (!missing.empty()) {
        logging::debug("prefs not set: {}", utils::join(missing, ", "));
    }
    return missing.empty();
}

std::expected<void, std::error_code> remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (!ec) {
        return {};
    }

    if (ec != std::errc::permission_denied && ec != std::errc::operation_not_permitted) {
        return std::unexpected(ec);
    }

    // Read-only entries (often left behind by the browser) block removal.
    grant_owner_write(path);
    for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        grant_owner_write(it->path());
    }

    ec.clear();
    fs::remove_all(path, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

} // namespace profile
