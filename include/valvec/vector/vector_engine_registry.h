#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <valvec/config/adapter_config.h>
#include <valvec/core/types.h>
#include <valvec/vector/embedding_engine.h>
#include <valvec/vector/vector_db_interface.h>

namespace valvec::vector {

using VectorEngineFactory = std::function<Result<std::shared_ptr<IVectorDbAdapter>>(
    const config::AdapterConfig&, std::shared_ptr<IEmbeddingEngine>)>;

/**
 * Provider name to adapter factory mapping. Owned by the caller; names are
 * case-insensitive. Registering an existing name replaces its factory.
 */
class VectorEngineRegistry {
public:
    VectorEngineRegistry() = default;

    void registerProvider(const std::string& name, VectorEngineFactory factory);

    // NotFound for unknown providers
    Result<std::shared_ptr<IVectorDbAdapter>>
    create(const std::string& name, const config::AdapterConfig& config,
           std::shared_ptr<IEmbeddingEngine> embeddingEngine) const;

    // Uses config.provider
    Result<std::shared_ptr<IVectorDbAdapter>>
    create(const config::AdapterConfig& config,
           std::shared_ptr<IEmbeddingEngine> embeddingEngine) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> providers() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, VectorEngineFactory> factories_;
};

// Installs the "valkey" provider
void registerValkeyProvider(VectorEngineRegistry& registry);

} // namespace valvec::vector
