#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace PeerBeam {

    /**
     * @brief key=value settings store
     *
     * Files contain one `key = value` per line; blank lines and lines starting
     * with '#' are skipped. Later files in loadLayered() win unless
     * overrideExisting is false.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;
        void clear();

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        /// @return defaultValue when the key is missing or not an integer
        int getInt(const std::string& key, int defaultValue = 0) const;

        /**
         * @brief Run each validator against its key, if present
         * @param failedKey Receives the first key that failed (optional)
         * @return false if any present key is rejected
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
