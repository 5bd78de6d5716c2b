#include <kiln/image.hpp>
#include <kiln/sha256.hpp>
#include <nlohmann/json.hpp>

namespace kiln {

using json = nlohmann::json;

std::string Layer::dir_name(size_t index) const {
    return std::to_string(index) + "-" + content_hash.substr(0, 12);
}

std::string Image::compute_content_hash() const {
    SHA256 h;
    h.update_field("kiln-image-v1");
    h.update_field(base_runtime);
    h.update_field(workdir);
    h.update_field("layers");
    for (const auto& l : layers) {
        h.update_field(l.action);
        h.update_field(l.destination);
        h.update_field(l.content_hash);
    }
    h.update_field("entrypoint");
    for (const auto& arg : entrypoint) h.update_field(arg);
    h.update_field("port");
    h.update_field(exposed_port ? std::to_string(*exposed_port) : "none");
    h.update_field("env");
    for (const auto& [k, v] : env) {
        h.update_field(k);
        h.update_field(v);
    }
    return h.finalize_hex();
}

std::string Image::entrypoint_string() const {
    std::string out;
    for (size_t i = 0; i < entrypoint.size(); ++i) {
        if (i > 0) out += ' ';
        out += entrypoint[i];
    }
    return out;
}

std::string Image::to_json() const {
    json j;
    j["service"] = service;
    j["environment"] = environment;
    j["base"] = base_runtime;
    j["workdir"] = workdir;
    j["entrypoint"] = entrypoint;
    j["exposed_port"] = exposed_port ? json(*exposed_port) : json(nullptr);
    j["env"] = json::object();
    for (const auto& [k, v] : env) j["env"][k] = v;
    j["output_kind"] = to_string(output_kind);
    j["runtime"] = static_server ? "static-server" : "process-runner";
    j["layers"] = json::array();
    for (size_t i = 0; i < layers.size(); ++i) {
        j["layers"].push_back({
            {"action", layers[i].action},
            {"destination", layers[i].destination},
            {"content_hash", layers[i].content_hash},
            {"path", "layers/" + layers[i].dir_name(i)},
        });
    }
    j["content_hash"] = content_hash;
    return j.dump(2) + "\n";
}

std::string Image::render_dockerfile() const {
    std::string out;
    out += "# Generated by kiln for " + service + " (" + environment + "). Do not edit.\n";
    out += "# content hash: " + content_hash + "\n";
    out += "FROM " + base_runtime + "\n";
    if (!workdir.empty()) out += "WORKDIR " + workdir + "\n";
    for (const auto& [k, v] : env) {
        // json string escaping matches Dockerfile double-quoted values
        out += "ENV " + k + "=" + json(v).dump() + "\n";
    }
    for (size_t i = 0; i < layers.size(); ++i) {
        std::string dest = layers[i].destination;
        if (dest.empty() || dest.back() != '/') dest += '/';
        out += "COPY layers/" + layers[i].dir_name(i) + "/ " + dest + "\n";
    }
    if (exposed_port) out += "EXPOSE " + std::to_string(*exposed_port) + "\n";
    out += "ENTRYPOINT " + json(entrypoint).dump() + "\n";
    return out;
}

} // namespace kiln
