// =============================================================================
// RedisClientImpl.h - hiredis backed RedisClient
// =============================================================================
#ifndef REDIS_CLIENT_IMPL_H
#define REDIS_CLIENT_IMPL_H

#include "Client/RedisClient.h"

#include <hiredis/hiredis.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace NemoBridge {

/**
 * @brief Synchronous hiredis client
 * @details One connection per instance. Every command runs under the
 * connection mutex; a transport error marks the client disconnected and
 * the owner decides when to reconnect.
 */
class RedisClientImpl : public RedisClient {
public:
    RedisClientImpl() = default;
    ~RedisClientImpl() override;

    RedisClientImpl(const RedisClientImpl&) = delete;
    RedisClientImpl& operator=(const RedisClientImpl&) = delete;

    bool connect(const std::string& host, int port, const std::string& password = "") override;
    void disconnect() override;
    bool isConnected() const override;
    bool select(int db_index) override;

    bool setex(const std::string& key, const std::string& value, int expire_seconds) override;
    std::string get(const std::string& key) override;

    std::string lpop(const std::string& key) override;
    std::optional<std::string> blpop(const std::string& key, int timeout_seconds) override;
    int llen(const std::string& key) override;

private:
    using ReplyPtr = std::unique_ptr<redisReply, void (*)(void*)>;

    bool openContext();
    void closeContext();
    ReplyPtr command(const char* format, ...);
    void applySocketTimeout(std::chrono::milliseconds timeout);

    static std::string stringReply(const redisReply* reply);
    static bool isStatusOK(const redisReply* reply);

    redisContext* context_{nullptr};

    std::string host_{"localhost"};
    int port_{6379};
    std::string password_;
    int database_{0};

    std::atomic<bool> connected_{false};
    std::mutex connection_mutex_;
};

} // namespace NemoBridge

#endif // REDIS_CLIENT_IMPL_H
