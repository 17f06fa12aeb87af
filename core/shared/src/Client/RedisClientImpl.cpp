// =============================================================================
// RedisClientImpl.cpp - hiredis backed RedisClient
// =============================================================================

#include "Client/RedisClientImpl.h"
#include "Logging/LogManager.h"

#include <cstdarg>
#include <cstring>
#include <sys/time.h>

namespace NemoBridge {

namespace {

const std::string LOG_CATEGORY = "redis";

const std::chrono::milliseconds CONNECT_TIMEOUT{5000};
const std::chrono::milliseconds COMMAND_TIMEOUT{10000};

struct timeval toTimeval(std::chrono::milliseconds ms) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

void logRedis(LogLevel level, const std::string& message) {
    LogManager::getInstance().log(LOG_CATEGORY, level, message);
}

} // namespace

RedisClientImpl::~RedisClientImpl() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    closeContext();
}

// =============================================================================
// Connection management
// =============================================================================

bool RedisClientImpl::connect(const std::string& host, int port, const std::string& password) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    host_ = host;
    port_ = port;
    password_ = password;
    return openContext();
}

void RedisClientImpl::disconnect() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    closeContext();
}

bool RedisClientImpl::isConnected() const {
    return connected_.load();
}

bool RedisClientImpl::select(int db_index) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    ReplyPtr reply = command("SELECT %d", db_index);
    if (!isStatusOK(reply.get())) {
        logRedis(LogLevel::LOG_ERROR, "SELECT " + std::to_string(db_index) + " failed");
        return false;
    }
    database_ = db_index;
    return true;
}

// =============================================================================
// Commands
// =============================================================================

bool RedisClientImpl::setex(const std::string& key, const std::string& value, int expire_seconds) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    ReplyPtr reply = command("SETEX %b %d %b", key.data(), key.size(), expire_seconds,
                             value.data(), value.size());
    if (!isStatusOK(reply.get())) {
        logRedis(LogLevel::WARN, "SETEX failed: key=" + key);
        return false;
    }
    return true;
}

std::string RedisClientImpl::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return stringReply(command("GET %b", key.data(), key.size()).get());
}

std::string RedisClientImpl::lpop(const std::string& key) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    return stringReply(command("LPOP %b", key.data(), key.size()).get());
}

std::optional<std::string> RedisClientImpl::blpop(const std::string& key, int timeout_seconds) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    if (!context_) {
        return std::nullopt;
    }

    // the socket must outlive the server-side wait
    applySocketTimeout(std::chrono::seconds(timeout_seconds) + COMMAND_TIMEOUT);
    ReplyPtr reply = command("BLPOP %b %d", key.data(), key.size(), timeout_seconds);
    applySocketTimeout(COMMAND_TIMEOUT);

    if (!reply) {
        return std::nullopt;
    }
    // [key, value] on success, nil on timeout
    if (reply->type == REDIS_REPLY_ARRAY && reply->elements == 2 && reply->element[1]) {
        return stringReply(reply->element[1]);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logRedis(LogLevel::WARN, "BLPOP error: " + std::string(reply->str, reply->len));
    }
    return std::nullopt;
}

int RedisClientImpl::llen(const std::string& key) {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    ReplyPtr reply = command("LLEN %b", key.data(), key.size());
    if (!reply || reply->type != REDIS_REPLY_INTEGER) {
        return -1;
    }
    return static_cast<int>(reply->integer);
}

// =============================================================================
// Internals (connection_mutex_ held)
// =============================================================================

bool RedisClientImpl::openContext() {
    closeContext();

    context_ = redisConnectWithTimeout(host_.c_str(), port_, toTimeval(CONNECT_TIMEOUT));
    if (!context_ || context_->err) {
        std::string reason = context_ ? context_->errstr : "cannot allocate context";
        logRedis(LogLevel::LOG_ERROR, "Connection to " + host_ + ":" + std::to_string(port_) +
                                          " failed: " + reason);
        closeContext();
        return false;
    }
    applySocketTimeout(COMMAND_TIMEOUT);

    if (!password_.empty()) {
        ReplyPtr auth = command("AUTH %b", password_.data(), password_.size());
        if (!isStatusOK(auth.get())) {
            logRedis(LogLevel::LOG_ERROR, "Redis authentication failed");
            closeContext();
            return false;
        }
    }

    if (database_ != 0) {
        ReplyPtr selected = command("SELECT %d", database_);
        if (!isStatusOK(selected.get())) {
            logRedis(LogLevel::LOG_ERROR, "SELECT " + std::to_string(database_) +
                                              " failed after reconnect");
            closeContext();
            return false;
        }
    }

    connected_ = true;
    logRedis(LogLevel::INFO, "Connected: " + host_ + ":" + std::to_string(port_));
    return true;
}

void RedisClientImpl::closeContext() {
    if (context_) {
        redisFree(context_);
        context_ = nullptr;
    }
    connected_ = false;
}

RedisClientImpl::ReplyPtr RedisClientImpl::command(const char* format, ...) {
    if (!context_) {
        return ReplyPtr(nullptr, freeReplyObject);
    }

    va_list args;
    va_start(args, format);
    void* raw = redisvCommand(context_, format, args);
    va_end(args);

    if (!raw && context_->err != 0) {
        logRedis(LogLevel::WARN, "Connection error: " + std::string(context_->errstr));
        // a context in error state cannot be reused
        closeContext();
    }
    return ReplyPtr(static_cast<redisReply*>(raw), freeReplyObject);
}

void RedisClientImpl::applySocketTimeout(std::chrono::milliseconds timeout) {
    if (context_) {
        redisSetTimeout(context_, toTimeval(timeout));
    }
}

std::string RedisClientImpl::stringReply(const redisReply* reply) {
    if (!reply) {
        return "";
    }
    switch (reply->type) {
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
            return reply->str ? std::string(reply->str, reply->len) : "";
        case REDIS_REPLY_INTEGER:
            return std::to_string(reply->integer);
        case REDIS_REPLY_ERROR:
            logRedis(LogLevel::WARN, "Redis error reply: " + std::string(reply->str, reply->len));
            return "";
        default:
            return "";
    }
}

bool RedisClientImpl::isStatusOK(const redisReply* reply) {
    return reply && reply->type == REDIS_REPLY_STATUS && reply->str &&
           std::strcmp(reply->str, "OK") == 0;
}

} // namespace NemoBridge
