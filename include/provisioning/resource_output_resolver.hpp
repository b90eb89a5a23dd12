#pragma once

#include "infrastructure/threading/cancellation.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>

namespace SSD {
class ThreadPool;
}

namespace SSD::Provisioning {

// EN: Raised when a provisioning output cannot be obtained.
// FR: Levée quand une sortie de provisionnement ne peut pas être obtenue.
class OutputResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// EN: Resolves named outputs of provisioned resources (endpoints, URLs...).
//     The future may wait until the provisioning engine has published the value.
// FR: Résout les sorties nommées des ressources provisionnées (endpoints, URLs...).
//     Le future peut attendre que le moteur de provisionnement ait publié la valeur.
class IResourceOutputResolver {
public:
    virtual ~IResourceOutputResolver() = default;
    virtual std::future<std::string> getOutputValue(const std::string& resource,
                                                    const std::string& output_name,
                                                    const CancellationToken& token) = 0;
};

struct JsonOutputsResolverOptions {
    std::filesystem::path outputs_file;
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
};

// EN: Reads the outputs document written by the provisioning step:
//       { "<resource>": { "<output>": "value" | { "value": "..." } } }
//     and polls it until the output appears or the timeout elapses.
// FR: Lit le document de sorties écrit par l'étape de provisionnement :
//       { "<resource>": { "<output>": "value" | { "value": "..." } } }
//     et le relit jusqu'à ce que la sortie apparaisse ou que le délai expire.
class JsonOutputsResolver : public IResourceOutputResolver {
public:
    JsonOutputsResolver(JsonOutputsResolverOptions options, ThreadPool& pool);

    std::future<std::string> getOutputValue(const std::string& resource,
                                            const std::string& output_name,
                                            const CancellationToken& token) override;

    // EN: Single read of the document; nullopt when the file, the resource or the output is missing.
    //     Output names match case-insensitively when there is no exact match.
    // FR: Lecture unique du document ; nullopt si le fichier, la ressource ou la sortie manque.
    //     Les noms de sortie sont comparés sans casse en l'absence de correspondance exacte.
    std::optional<std::string> tryRead(const std::string& resource, const std::string& output_name) const;

private:
    std::string resolve(const std::string& resource, const std::string& output_name,
                        const CancellationToken& token) const;

    JsonOutputsResolverOptions options_;
    ThreadPool& pool_;
};

} // namespace SSD::Provisioning
