#ifndef STORIFY_SRC_STORAGE_STORE_FACTORY_HPP_
#define STORIFY_SRC_STORAGE_STORE_FACTORY_HPP_

#include "config/config_types.hpp"
#include "storage/i_object_store.hpp"

#include <functional>
#include <map>
#include <memory>

namespace Storify::Storage
{

// Maps a provider tag to the builder producing its object store.
class StoreFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Internal Types
    //------------------------------------------------------------------------------//
    using Builder = std::function<StorageResult<std::unique_ptr<IObjectStore>>(
        const Config::StorageDefinition&
    )>;

    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//

    // Starts with the fs and memory builders registered.
    StoreFactory();
    ~StoreFactory() = default;

    StoreFactory(const StoreFactory&)            = delete;
    StoreFactory& operator=(const StoreFactory&) = delete;
    StoreFactory(StoreFactory&&)                 = default;
    StoreFactory& operator=(StoreFactory&&)      = default;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // Replaces any builder already registered for the provider.
    void Register(Config::ProviderType provider, Builder builder);
    bool IsRegistered(Config::ProviderType provider) const;

    StorageResult<std::unique_ptr<IObjectStore>> Create(
        const Config::StorageDefinition& definition
    ) const;

    private:
    //------------------------------------------------------------------------------//
    // Private Fields
    //------------------------------------------------------------------------------//
    std::map<Config::ProviderType, Builder> builders_;
};

}  // namespace Storify::Storage

#endif  // STORIFY_SRC_STORAGE_STORE_FACTORY_HPP_
