// EN: Implementation of the JSON outputs resolver.
// FR: Implémentation du résolveur de sorties JSON.

#include "provisioning/resource_output_resolver.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace SSD::Provisioning {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

const nlohmann::json* findMember(const nlohmann::json& object, const std::string& name) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(name);
    if (it != object.end()) {
        return &*it;
    }
    for (auto candidate = object.begin(); candidate != object.end(); ++candidate) {
        if (equalsIgnoreCase(candidate.key(), name)) {
            return &candidate.value();
        }
    }
    return nullptr;
}

} // namespace

JsonOutputsResolver::JsonOutputsResolver(JsonOutputsResolverOptions options, ThreadPool& pool)
    : options_(std::move(options)), pool_(pool) {}

std::future<std::string> JsonOutputsResolver::getOutputValue(const std::string& resource,
                                                             const std::string& output_name,
                                                             const CancellationToken& token) {
    return pool_.submitNamed("resolve " + resource + "." + output_name, TaskPriority::HIGH,
                             [this, resource, output_name, token]() {
                                 return resolve(resource, output_name, token);
                             });
}

std::optional<std::string> JsonOutputsResolver::tryRead(const std::string& resource,
                                                        const std::string& output_name) const {
    std::ifstream input(options_.outputs_file);
    if (!input.is_open()) {
        return std::nullopt;
    }

    // EN: A partially written document is treated as "not yet available".
    // FR: Un document partiellement écrit est traité comme "pas encore disponible".
    const nlohmann::json document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        SSD_LOG_DEBUG("provisioning", "Outputs document is not valid JSON yet: " + options_.outputs_file.string());
        return std::nullopt;
    }

    const nlohmann::json* resource_outputs = findMember(document, resource);
    if (!resource_outputs) {
        return std::nullopt;
    }
    const nlohmann::json* output = findMember(*resource_outputs, output_name);
    if (!output) {
        return std::nullopt;
    }
    if (output->is_object()) {
        output = findMember(*output, "value");
        if (!output) {
            return std::nullopt;
        }
    }
    if (!output->is_string()) {
        throw OutputResolutionError("Output " + resource + "." + output_name + " is not a string");
    }
    return output->get<std::string>();
}

std::string JsonOutputsResolver::resolve(const std::string& resource, const std::string& output_name,
                                         const CancellationToken& token) const {
    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    bool logged_wait = false;

    while (true) {
        token.throwIfCancellationRequested();
        if (auto value = tryRead(resource, output_name)) {
            SSD_LOG_DEBUG("provisioning", "Resolved " + resource + "." + output_name);
            return *value;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw OutputResolutionError("Timed out waiting for output " + resource + "." + output_name +
                                        " in " + options_.outputs_file.string());
        }
        if (!logged_wait) {
            SSD_LOG_INFO("provisioning", "Waiting for output " + resource + "." + output_name);
            logged_wait = true;
        }
        if (token.waitFor(options_.poll_interval)) {
            throw OperationCancelledError("Resolution of " + resource + "." + output_name + " cancelled");
        }
    }
}

} // namespace SSD::Provisioning
