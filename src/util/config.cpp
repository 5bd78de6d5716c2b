#include <kiln/config.hpp>
#include <kiln/ident.hpp>
#include <kiln/log.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace kiln {

namespace {

KilnError config_error(const std::string& where, const std::string& msg,
                       const std::string& hint = "") {
    return KilnError{KilnError::Config, where + ": " + msg, hint};
}

Result<std::vector<std::string>> read_string_array(const toml::node& node,
                                                   const std::string& where) {
    auto arr = node.as_array();
    if (!arr) {
        return config_error(where, "expected an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return config_error(where, "expected an array of strings");
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// A command is either a whitespace-separated string or an argv array
Result<std::vector<std::string>> read_command(const toml::node& node,
                                              const std::string& where) {
    if (auto s = node.value<std::string>()) {
        std::vector<std::string> argv;
        std::istringstream in(*s);
        std::string word;
        while (in >> word) argv.push_back(word);
        if (argv.empty()) {
            return config_error(where, "command is empty");
        }
        return Result<std::vector<std::string>>::ok(std::move(argv));
    }
    auto argv = read_string_array(node, where);
    if (argv.is_err()) return argv;
    if (argv.value().empty()) {
        return config_error(where, "command is empty");
    }
    return argv;
}

Status read_string(const toml::table& tbl, const char* key,
                   std::string& out, const std::string& where) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<std::string>();
    if (!v) return config_error(where + "." + key, "expected a string");
    out = *v;
    return ok_status();
}

Status read_bool(const toml::table& tbl, const char* key,
                 bool& out, const std::string& where) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<bool>();
    if (!v) return config_error(where + "." + key, "expected true or false");
    out = *v;
    return ok_status();
}

Status read_timeout(const toml::table& tbl, const char* key,
                    int& out, const std::string& where) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<int64_t>();
    if (!v || *v <= 0 || *v > 24 * 3600) {
        return config_error(where + "." + key,
            "expected a positive number of seconds",
            "e.g. " + std::string(key) + " = 600");
    }
    out = static_cast<int>(*v);
    return ok_status();
}

void warn_unknown_keys(const toml::table& tbl, const std::string& where,
                       const std::set<std::string>& known) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (known.count(k) == 0) {
            log::warn("%s: ignoring unknown key '%s'", where.c_str(), k.c_str());
        }
    }
}

// Table keys become map keys in normalized form
Result<std::string> read_name(const std::string& raw, const std::string& kind) {
    auto id = Ident::parse(raw, kind);
    if (id.is_err()) {
        KilnError e = std::move(id).error();
        e.code = KilnError::Config;
        return e;
    }
    return Result<std::string>::ok(id.value().normalized());
}

Status parse_settings(const toml::table& tbl, Config& cfg) {
    const std::string where = "settings";
    warn_unknown_keys(tbl, where, {"cache_root", "build_root", "install_timeout",
        "compile_timeout", "web_server_base", "static_entrypoint", "static_root",
        "keep_workdirs"});

    Settings& s = cfg.settings;
    KILN_TRY(read_string(tbl, "cache_root", s.cache_root, where));
    KILN_TRY(read_string(tbl, "build_root", s.build_root, where));
    KILN_TRY(read_timeout(tbl, "install_timeout", s.install_timeout, where));
    KILN_TRY(read_timeout(tbl, "compile_timeout", s.compile_timeout, where));
    KILN_TRY(read_string(tbl, "web_server_base", s.web_server_base, where));
    KILN_TRY(read_string(tbl, "static_root", s.static_root, where));
    KILN_TRY(read_bool(tbl, "keep_workdirs", s.keep_workdirs, where));
    if (const toml::node* node = tbl.get("static_entrypoint")) {
        auto argv = read_command(*node, where + ".static_entrypoint");
        if (argv.is_err()) return std::move(argv).error();
        s.static_entrypoint = std::move(argv).value();
    }

    for (const auto& [key, val] : tbl) {
        cfg.settings_set.insert(std::string(key.str()));
    }
    return ok_status();
}

Result<Ecosystem> parse_ecosystem(const std::string& name, const toml::table& tbl,
                                  const Ecosystem* base) {
    const std::string where = "ecosystems." + name;
    warn_unknown_keys(tbl, where, {"format", "manifest", "lock", "deps_dir",
        "deps_target", "runtime_base", "install_full", "install_clean",
        "default_exclude"});

    Ecosystem eco = base ? *base : Ecosystem{};
    eco.name = name;

    std::string format;
    KILN_TRY(read_string(tbl, "format", format, where));
    if (!format.empty()) {
        auto f = parse_manifest_format(format);
        if (f.is_err()) return std::move(f).error();
        eco.format = f.value();
    }
    KILN_TRY(read_string(tbl, "manifest", eco.manifest_file, where));
    KILN_TRY(read_string(tbl, "lock", eco.lock_file, where));
    KILN_TRY(read_string(tbl, "deps_dir", eco.deps_dir, where));
    KILN_TRY(read_string(tbl, "deps_target", eco.deps_target, where));
    KILN_TRY(read_string(tbl, "runtime_base", eco.runtime_base, where));

    if (const toml::node* node = tbl.get("install_full")) {
        auto argv = read_command(*node, where + ".install_full");
        if (argv.is_err()) return std::move(argv).error();
        eco.install_full = std::move(argv).value();
    }
    if (const toml::node* node = tbl.get("install_clean")) {
        auto argv = read_command(*node, where + ".install_clean");
        if (argv.is_err()) return std::move(argv).error();
        eco.install_clean = std::move(argv).value();
    }
    if (const toml::node* node = tbl.get("default_exclude")) {
        auto globs = read_string_array(*node, where + ".default_exclude");
        if (globs.is_err()) return std::move(globs).error();
        eco.default_exclude = std::move(globs).value();
    }
    return Result<Ecosystem>::ok(std::move(eco));
}

Result<ServiceDescriptor> parse_service(const std::string& name, const toml::table& tbl,
                                        const ServiceDescriptor* base) {
    const std::string where = "services." + name;
    warn_unknown_keys(tbl, where, {"source", "ecosystem", "build_step",
        "build_command", "build_output", "entrypoint", "port", "serve",
        "exclude", "workdir"});

    ServiceDescriptor svc = base ? *base : ServiceDescriptor{};
    svc.name = name;
    if (svc.source_path.empty()) svc.source_path = name;

    KILN_TRY(read_string(tbl, "source", svc.source_path, where));
    KILN_TRY(read_string(tbl, "ecosystem", svc.ecosystem, where));
    KILN_TRY(read_bool(tbl, "build_step", svc.has_build_step, where));
    KILN_TRY(read_string(tbl, "build_output", svc.build_output, where));
    KILN_TRY(read_string(tbl, "workdir", svc.workdir, where));

    if (const toml::node* node = tbl.get("build_command")) {
        auto argv = read_command(*node, where + ".build_command");
        if (argv.is_err()) return std::move(argv).error();
        svc.build_command = std::move(argv).value();
    }
    if (const toml::node* node = tbl.get("entrypoint")) {
        auto argv = read_command(*node, where + ".entrypoint");
        if (argv.is_err()) return std::move(argv).error();
        svc.entrypoint = std::move(argv).value();
    }
    if (const toml::node* node = tbl.get("port")) {
        auto v = node->value<int64_t>();
        if (!v) return config_error(where + ".port", "expected an integer");
        svc.exposed_port = static_cast<int>(*v);
    }
    std::string serve;
    KILN_TRY(read_string(tbl, "serve", serve, where));
    if (!serve.empty()) {
        auto m = parse_serve_mode(serve);
        if (m.is_err()) return std::move(m).error();
        svc.serve = m.value();
    }
    if (const toml::node* node = tbl.get("exclude")) {
        auto globs = read_string_array(*node, where + ".exclude");
        if (globs.is_err()) return std::move(globs).error();
        svc.exclude = std::move(globs).value();
    }
    return Result<ServiceDescriptor>::ok(std::move(svc));
}

Result<EnvironmentProfile> parse_environment(const std::string& name, const toml::table& tbl,
                                             const EnvironmentProfile* base) {
    const std::string where = "environments." + name;
    warn_unknown_keys(tbl, where, {"install_mode", "build_enabled", "env"});

    EnvironmentProfile env = base ? *base : EnvironmentProfile{};
    env.name = name;

    std::string mode;
    KILN_TRY(read_string(tbl, "install_mode", mode, where));
    if (!mode.empty()) {
        auto m = parse_install_mode(mode);
        if (m.is_err()) return std::move(m).error();
        env.install_mode = m.value();
    }
    KILN_TRY(read_bool(tbl, "build_enabled", env.build_enabled, where));

    if (const toml::node* node = tbl.get("env")) {
        auto vars = node->as_table();
        if (!vars) return config_error(where + ".env", "expected a table");
        // A layer that sets env replaces the whole set, so a profile never
        // carries variables its own definition does not list
        env.env_vars.clear();
        for (const auto& [key, val] : *vars) {
            std::string k(key.str());
            if (auto s = val.value<std::string>()) {
                env.env_vars[k] = *s;
            } else if (val.is_boolean()) {
                env.env_vars[k] = *val.value<bool>() ? "true" : "false";
            } else if (val.is_integer()) {
                env.env_vars[k] = std::to_string(*val.value<int64_t>());
            } else {
                return config_error(where + ".env." + k,
                    "expected a string, integer or boolean");
            }
        }
    }
    return Result<EnvironmentProfile>::ok(std::move(env));
}

template<typename T>
const T* find_base(const Config* base, std::map<std::string, T> Config::*member,
                   const std::string& name) {
    if (!base) return nullptr;
    const auto& m = base->*member;
    auto it = m.find(name);
    return it == m.end() ? nullptr : &it->second;
}

template<typename T>
Result<const T*> find_named(const std::map<std::string, T>& m, const std::string& name,
                            const std::string& kind) {
    auto id = Ident::parse(name, kind);
    if (id.is_err()) return std::move(id).error();

    auto it = m.find(id.value().normalized());
    if (it == m.end()) {
        std::string known;
        for (const auto& [k, v] : m) {
            if (!known.empty()) known += ", ";
            known += k;
        }
        return KilnError{KilnError::InvalidArg,
            "unknown " + kind + " '" + name + "'",
            known.empty() ? "no " + kind + "s are configured"
                          : "known " + kind + "s: " + known};
    }
    return Result<const T*>::ok(&it->second);
}

bool is_relative_inside(const std::string& p) {
    std::filesystem::path path(p);
    if (p.empty() || path.is_absolute()) return false;
    for (const auto& part : path) {
        if (part == "..") return false;
    }
    return true;
}

} // namespace

Config Config::builtin() {
    Config cfg;

    Ecosystem python;
    python.name = "python";
    python.format = ManifestFormat::Requirements;
    python.manifest_file = "requirements.txt";
    python.lock_file = "requirements.lock";
    python.deps_dir = "site-packages";
    python.deps_target = "/usr/local/lib/python3.11/site-packages";
    python.runtime_base = "python:3.11-slim";
    python.install_full = {"python3", "-m", "pip", "install",
        "--disable-pip-version-check", "--no-input",
        "--target", "{{ deps_dir }}", "-r", "{{ manifest }}"};
    python.install_clean = {"python3", "-m", "pip", "install",
        "--disable-pip-version-check", "--no-input", "--no-deps",
        "--target", "{{ deps_dir }}", "-r", "{{ lock }}"};
    python.default_exclude = {".git", "__pycache__", "*.pyc", ".venv", "venv"};
    cfg.ecosystems[python.name] = python;

    Ecosystem node;
    node.name = "node";
    node.format = ManifestFormat::PackageJson;
    node.manifest_file = "package.json";
    node.lock_file = "package-lock.json";
    node.deps_dir = "node_modules";
    node.deps_target = "/app/node_modules";
    node.runtime_base = "node:20-alpine";
    node.install_full = {"npm", "install", "--no-audit", "--no-fund"};
    node.install_clean = {"npm", "ci", "--no-audit", "--no-fund"};
    node.default_exclude = {".git", "node_modules", "build", "npm-debug.log*"};
    cfg.ecosystems[node.name] = node;

    ServiceDescriptor worker;
    worker.name = "worker";
    worker.source_path = "app2";
    worker.ecosystem = "python";
    worker.entrypoint = {"python3", "app2.py"};
    worker.serve = ServeMode::Process;
    cfg.services[worker.name] = worker;

    ServiceDescriptor portal;
    portal.name = "adminportal";
    portal.source_path = "adminportal";
    portal.ecosystem = "node";
    portal.has_build_step = true;
    portal.build_command = {"npm", "run", "build"};
    portal.build_output = "build";
    portal.entrypoint = {"npm", "start"};
    portal.exposed_port = 3000;
    portal.serve = ServeMode::Static;
    cfg.services[portal.name] = portal;

    EnvironmentProfile dev;
    dev.name = "dev";
    dev.install_mode = InstallMode::Full;
    dev.build_enabled = false;
    dev.env_vars = {{"APP_ENV", "development"}, {"DEBUG", "1"}};
    cfg.environments[dev.name] = dev;

    EnvironmentProfile prod;
    prod.name = "production";
    prod.install_mode = InstallMode::CiClean;
    prod.build_enabled = true;
    prod.env_vars = {{"APP_ENV", "production"}};
    cfg.environments[prod.name] = prod;

    return cfg;
}

Result<Config> Config::parse(const std::string& toml_str, const Config* base) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KilnError{KilnError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [settings]
    if (auto settings = doc["settings"].as_table()) {
        KILN_TRY(parse_settings(*settings, cfg));
    }

    // [log]
    if (auto logt = doc["log"].as_table()) {
        std::string level;
        KILN_TRY(read_string(*logt, "level", level, "log"));
        if (!level.empty()) {
            KILN_TRY(log::parse_level(level));
            cfg.settings.log_level = level;
            cfg.settings_set.insert("log_level");
        }
    }

    // [ecosystems.<name>]
    if (auto ecos = doc["ecosystems"].as_table()) {
        for (const auto& [key, val] : *ecos) {
            auto tbl = val.as_table();
            if (!tbl) {
                return config_error("ecosystems." + std::string(key.str()), "expected a table");
            }
            auto name = read_name(std::string(key.str()), "ecosystem");
            if (name.is_err()) return std::move(name).error();
            auto eco = parse_ecosystem(name.value(), *tbl,
                find_base(base, &Config::ecosystems, name.value()));
            if (eco.is_err()) return std::move(eco).error();
            cfg.ecosystems[name.value()] = std::move(eco).value();
        }
    }

    // [services.<name>]
    if (auto services = doc["services"].as_table()) {
        for (const auto& [key, val] : *services) {
            auto tbl = val.as_table();
            if (!tbl) {
                return config_error("services." + std::string(key.str()), "expected a table");
            }
            auto name = read_name(std::string(key.str()), "service");
            if (name.is_err()) return std::move(name).error();
            auto svc = parse_service(name.value(), *tbl,
                find_base(base, &Config::services, name.value()));
            if (svc.is_err()) return std::move(svc).error();
            cfg.services[name.value()] = std::move(svc).value();
        }
    }

    // [environments.<name>]
    if (auto envs = doc["environments"].as_table()) {
        for (const auto& [key, val] : *envs) {
            auto tbl = val.as_table();
            if (!tbl) {
                return config_error("environments." + std::string(key.str()), "expected a table");
            }
            auto name = read_name(std::string(key.str()), "environment");
            if (name.is_err()) return std::move(name).error();
            auto env = parse_environment(name.value(), *tbl,
                find_base(base, &Config::environments, name.value()));
            if (env.is_err()) return std::move(env).error();
            cfg.environments[name.value()] = std::move(env).value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path, const Config* base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KilnError{KilnError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str(), base);
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    // Settings: other overrides only explicitly-set keys
    const Settings& o = other.settings;
    for (const auto& key : other.settings_set) {
        if (key == "cache_root") settings.cache_root = o.cache_root;
        else if (key == "build_root") settings.build_root = o.build_root;
        else if (key == "install_timeout") settings.install_timeout = o.install_timeout;
        else if (key == "compile_timeout") settings.compile_timeout = o.compile_timeout;
        else if (key == "web_server_base") settings.web_server_base = o.web_server_base;
        else if (key == "static_entrypoint") settings.static_entrypoint = o.static_entrypoint;
        else if (key == "static_root") settings.static_root = o.static_root;
        else if (key == "keep_workdirs") settings.keep_workdirs = o.keep_workdirs;
        else if (key == "log_level") settings.log_level = o.log_level;
        else continue;
        settings_set.insert(key);
    }

    // Named entries: other overrides this per-entry
    for (const auto& [k, v] : other.ecosystems) ecosystems[k] = v;
    for (const auto& [k, v] : other.services) services[k] = v;
    for (const auto& [k, v] : other.environments) environments[k] = v;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result = Config::builtin();
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

Status Config::validate() const {
    for (const auto& [name, eco] : ecosystems) {
        const std::string where = "ecosystems." + name;
        if (eco.manifest_file.empty()) {
            return config_error(where, "no manifest file configured");
        }
        if (!is_relative_inside(eco.deps_dir)) {
            return config_error(where + ".deps_dir",
                "must be a relative path inside the install directory");
        }
        if (eco.deps_target.empty() || eco.deps_target[0] != '/') {
            return config_error(where + ".deps_target", "must be an absolute in-image path");
        }
        if (eco.install_full.empty() || eco.install_clean.empty()) {
            return config_error(where, "both install_full and install_clean must be set");
        }
    }

    for (const auto& [name, svc] : services) {
        const std::string where = "services." + name;
        if (ecosystems.count(svc.ecosystem) == 0) {
            std::string known;
            for (const auto& [k, v] : ecosystems) {
                if (!known.empty()) known += ", ";
                known += k;
            }
            return config_error(where + ".ecosystem",
                "unknown ecosystem '" + svc.ecosystem + "'",
                "known ecosystems: " + known);
        }
        if (!is_relative_inside(svc.source_path)) {
            return config_error(where + ".source",
                "must be a relative path inside the project");
        }
        if (svc.entrypoint.empty()) {
            return config_error(where, "no entrypoint configured");
        }
        if (svc.has_build_step) {
            if (svc.build_command.empty()) {
                return config_error(where, "build_step is set but build_command is empty");
            }
            if (!is_relative_inside(svc.build_output)) {
                return config_error(where + ".build_output",
                    "must be a relative path inside the source tree");
            }
        }
        if (svc.workdir.empty() || svc.workdir[0] != '/') {
            return config_error(where + ".workdir", "must be an absolute in-image path");
        }
    }
    return ok_status();
}

Result<const ServiceDescriptor*> Config::find_service(const std::string& name) const {
    return find_named(services, name, "service");
}

Result<const EnvironmentProfile*> Config::find_environment(const std::string& name) const {
    return find_named(environments, name, "environment");
}

Result<const Ecosystem*> Config::find_ecosystem(const std::string& name) const {
    return find_named(ecosystems, name, "ecosystem");
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.kiln/config.toml";
}

std::string default_cache_root() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home) + "/.kiln/cache";
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "kiln-cache").string();
}

} // namespace kiln
