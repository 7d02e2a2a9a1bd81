#include <valvec/vector/vector_engine_registry.h>

#include <spdlog/spdlog.h>

#include <valvec/config/config_helpers.h>
#include <valvec/core/format.h>
#include <valvec/vector/valkey_adapter.h>

namespace valvec::vector {

void VectorEngineRegistry::registerProvider(const std::string& name, VectorEngineFactory factory) {
    auto key = config::to_lower(name);
    std::lock_guard<std::mutex> lock(mutex_);
    if (factories_.count(key)) {
        spdlog::debug("[VectorEngineRegistry] replacing provider '{}'", key);
    }
    factories_[key] = std::move(factory);
}

Result<std::shared_ptr<IVectorDbAdapter>>
VectorEngineRegistry::create(const std::string& name, const config::AdapterConfig& config,
                             std::shared_ptr<IEmbeddingEngine> embeddingEngine) const {
    VectorEngineFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(config::to_lower(name));
        if (it == factories_.end()) {
            return Error{ErrorCode::NotFound,
                         valvec::format("Unknown vector database provider '{}'", name)};
        }
        factory = it->second;
    }
    return factory(config, std::move(embeddingEngine));
}

Result<std::shared_ptr<IVectorDbAdapter>>
VectorEngineRegistry::create(const config::AdapterConfig& config,
                             std::shared_ptr<IEmbeddingEngine> embeddingEngine) const {
    return create(config.provider, config, std::move(embeddingEngine));
}

bool VectorEngineRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(config::to_lower(name)) > 0;
}

std::vector<std::string> VectorEngineRegistry::providers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        names.push_back(name);
    }
    return names;
}

void registerValkeyProvider(VectorEngineRegistry& registry) {
    registry.registerProvider(
        "valkey",
        [](const config::AdapterConfig& config, std::shared_ptr<IEmbeddingEngine> engine)
            -> Result<std::shared_ptr<IVectorDbAdapter>> {
            auto adapter = ValkeyAdapter::create(config, std::move(engine));
            if (!adapter) {
                return adapter.error();
            }
            return std::static_pointer_cast<IVectorDbAdapter>(adapter.value());
        });
}

} // namespace valvec::vector
