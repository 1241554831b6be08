#ifndef KVWIRE_STORE_H
#define KVWIRE_STORE_H

#include <optional>
#include <photon/thread/std-compat.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "framer/frame.h"

namespace kvwire
{
    /**
     * @brief Store is the key-value mapping the commands work on.
     *
     * Keys are opaque byte strings, values are scalar frames. An implementation is shared by every connection,
     * each call must be atomic with respect to calls made from other connections.
     */
    class Store
    {
    public:
        virtual ~Store() = default;

        // get returns the value under key, or nullopt if the key was never written or was deleted.
        virtual std::optional<Frame> get(const std::string& key) = 0;

        virtual void set(std::string key, Frame value) = 0;

        // del returns true if the key existed.
        virtual bool del(const std::string& key) = 0;

        // clear drops every entry and returns how many there were.
        virtual size_t clear() = 0;

        // multi_get returns one slot per requested key, in the same order.
        virtual std::vector<std::optional<Frame>> multi_get(const std::vector<std::string>& keys) = 0;

        // multi_set writes every pair in order, a later pair wins over an earlier one with the same key.
        // It returns the number of pairs written.
        virtual size_t multi_set(std::vector<std::pair<std::string, Frame>> pairs) = 0;

        virtual size_t size() = 0;
    };

    /**
     * @brief MemoryStore keeps everything in a hash map guarded by a single photon mutex. Connections run on several
     * vcpus, the mutex serializes them.
     */
    class MemoryStore final : public Store
    {
    public:
        MemoryStore() = default;
        MemoryStore(const MemoryStore&) = delete;
        MemoryStore& operator=(const MemoryStore&) = delete;

        std::optional<Frame> get(const std::string& key) override;
        void set(std::string key, Frame value) override;
        bool del(const std::string& key) override;
        size_t clear() override;
        std::vector<std::optional<Frame>> multi_get(const std::vector<std::string>& keys) override;
        size_t multi_set(std::vector<std::pair<std::string, Frame>> pairs) override;
        size_t size() override;

    private:
        photon_std::mutex mu_;
        std::unordered_map<std::string, Frame> data_;
    };
}  // namespace kvwire

#endif  // KVWIRE_STORE_H
