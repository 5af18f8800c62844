#include "stowage/descriptor.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace stowage {

namespace {

constexpr const char* SERVICES_KEY = "services";
constexpr const char* IMAGE_KEY = "image";

Error input_error(const std::string& message) {
    return Error(ErrorCode::INPUT_ERROR, message);
}

// Plain (unquoted, untagged) scalars that YAML resolves to a number or boolean
bool is_non_string_scalar(const YAML::Node& node) {
    if (node.Tag() != "?") {
        return false;
    }
    bool b;
    long long i;
    double d;
    return YAML::convert<bool>::decode(node, b) ||
           YAML::convert<long long>::decode(node, i) ||
           YAML::convert<double>::decode(node, d);
}

Result<ServiceDescriptor> parse_service(const std::string& name, const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<ServiceDescriptor>::err(
            input_error("Service(" + name + ") has invalid format"));
    }

    ServiceDescriptor service;
    service.name = name;
    service.extra = YAML::Node(YAML::NodeType::Map);

    bool has_image = false;
    for (const auto& field : node) {
        if (!field.first.IsScalar()) {
            return Result<ServiceDescriptor>::err(
                input_error("Service(" + name + ") has a non-scalar key"));
        }
        std::string key = field.first.Scalar();
        if (key == IMAGE_KEY) {
            if (!field.second.IsScalar() || field.second.Scalar().empty() ||
                is_non_string_scalar(field.second)) {
                return Result<ServiceDescriptor>::err(
                    input_error("Service(" + name + ") invalid 'image' attribute"));
            }
            service.image = field.second.Scalar();
            has_image = true;
        } else {
            service.extra[key] = YAML::Clone(field.second);
        }
    }

    if (!has_image) {
        return Result<ServiceDescriptor>::err(
            input_error("Service(" + name + ") missing 'image' attribute"));
    }
    return Result<ServiceDescriptor>::ok(std::move(service));
}

} // namespace

AppDescriptor::AppDescriptor() : document_(YAML::NodeType::Map) {}

Result<AppDescriptor> AppDescriptor::parse(const std::string& text, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Result<AppDescriptor>::err(
            input_error("failed to parse " + source + ": " + std::string(e.what())));
    }

    if (!root.IsMap()) {
        return Result<AppDescriptor>::err(input_error(source + ": descriptor must be a mapping"));
    }

    AppDescriptor descriptor;
    for (const auto& entry : root) {
        if (!entry.first.IsScalar()) {
            return Result<AppDescriptor>::err(input_error(source + ": non-scalar top-level key"));
        }
        std::string key = entry.first.Scalar();
        if (std::find(descriptor.top_level_order_.begin(), descriptor.top_level_order_.end(), key) !=
            descriptor.top_level_order_.end()) {
            return Result<AppDescriptor>::err(input_error(source + ": duplicate key '" + key + "'"));
        }
        descriptor.top_level_order_.push_back(key);

        if (key != SERVICES_KEY) {
            descriptor.document_[key] = YAML::Clone(entry.second);
            continue;
        }

        if (entry.second.IsNull()) {
            continue;
        }
        if (!entry.second.IsMap()) {
            return Result<AppDescriptor>::err(input_error(source + ": 'services' must be a mapping"));
        }

        for (const auto& svc : entry.second) {
            if (!svc.first.IsScalar()) {
                return Result<AppDescriptor>::err(input_error(source + ": non-scalar service name"));
            }
            std::string name = svc.first.Scalar();
            if (descriptor.services_.count(name) != 0) {
                return Result<AppDescriptor>::err(
                    input_error("Service(" + name + ") is defined more than once"));
            }
            auto service = parse_service(name, svc.second);
            if (service.isErr()) {
                return Result<AppDescriptor>::err(service.error());
            }
            descriptor.services_.emplace(name, std::move(service.value()));
        }
    }

    return Result<AppDescriptor>::ok(std::move(descriptor));
}

Result<AppDescriptor> AppDescriptor::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<AppDescriptor>::err(input_error("failed to read descriptor: " + path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str(), path);
}

bool AppDescriptor::has_service(const std::string& name) const {
    return services_.count(name) != 0;
}

const ServiceDescriptor* AppDescriptor::find_service(const std::string& name) const {
    auto it = services_.find(name);
    return it == services_.end() ? nullptr : &it->second;
}

void AppDescriptor::add_service(const std::string& name, const std::string& image) {
    ServiceDescriptor service;
    service.name = name;
    service.image = image;
    service.extra = YAML::Node(YAML::NodeType::Map);
    services_[name] = std::move(service);

    if (std::find(top_level_order_.begin(), top_level_order_.end(), SERVICES_KEY) ==
        top_level_order_.end()) {
        top_level_order_.push_back(SERVICES_KEY);
    }
}

Status AppDescriptor::set_image(const std::string& name, const std::string& image) {
    auto it = services_.find(name);
    if (it == services_.end()) {
        return Status::err(input_error("Service(" + name + ") not found"));
    }
    it->second.image = image;
    return Status::ok();
}

Result<std::string> AppDescriptor::serialize() const {
    YAML::Node out(YAML::NodeType::Map);

    for (const auto& key : top_level_order_) {
        if (key != SERVICES_KEY) {
            out[key] = document_[key];
            continue;
        }

        YAML::Node services(YAML::NodeType::Map);
        for (const auto& [name, service] : services_) {
            YAML::Node node(YAML::NodeType::Map);
            node[IMAGE_KEY] = service.image;
            for (const auto& field : service.extra) {
                node[field.first.Scalar()] = field.second;
            }
            services[name] = node;
        }
        out[SERVICES_KEY] = services;
    }

    YAML::Emitter emitter;
    emitter << out;
    if (!emitter.good()) {
        return Result<std::string>::err(
            input_error("failed to serialize descriptor: " + emitter.GetLastError()));
    }
    return Result<std::string>::ok(std::string(emitter.c_str()) + "\n");
}

} // namespace stowage
