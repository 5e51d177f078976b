#include "storage/store_factory.hpp"

#include "storage/local_object_store.hpp"
#include "storage/memory_object_store.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace Storify::Storage
{

namespace
{

StorageResult<std::unique_ptr<IObjectStore>> BuildLocalStore(
    const Config::StorageDefinition& definition
)
{
    std::unique_ptr<LocalObjectStore> store;
    try {
        store = std::make_unique<LocalObjectStore>(definition);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create local object store: {}", e.what());
        return std::unexpected(make_error_code(StorageErrc::InvalidArgument));
    }
    if (auto init_res = store->Initialize(); !init_res) {
        return std::unexpected(init_res.error());
    }
    return store;
}

StorageResult<std::unique_ptr<IObjectStore>> BuildMemoryStore(const Config::StorageDefinition&)
{
    return std::make_unique<MemoryObjectStore>();
}

}  // namespace

StoreFactory::StoreFactory()
{
    Register(Config::ProviderType::Fs, BuildLocalStore);
    Register(Config::ProviderType::Memory, BuildMemoryStore);
}

void StoreFactory::Register(Config::ProviderType provider, Builder builder)
{
    spdlog::debug("StoreFactory: registering provider '{}'", Config::ProviderTypeToString(provider));
    builders_[provider] = std::move(builder);
}

bool StoreFactory::IsRegistered(Config::ProviderType provider) const
{
    return builders_.contains(provider);
}

StorageResult<std::unique_ptr<IObjectStore>> StoreFactory::Create(
    const Config::StorageDefinition& definition
) const
{
    auto it = builders_.find(definition.provider);
    if (it == builders_.end() || !it->second) {
        spdlog::error(
            "Storage provider '{}' is not supported by this build.",
            Config::ProviderTypeToString(definition.provider)
        );
        return std::unexpected(make_error_code(StorageErrc::NotSupported));
    }
    return it->second(definition);
}

}  // namespace Storify::Storage
