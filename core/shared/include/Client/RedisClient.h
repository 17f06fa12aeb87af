// core/shared/include/Client/RedisClient.h
#ifndef REDIS_CLIENT_H
#define REDIS_CLIENT_H

#include <optional>
#include <string>

namespace NemoBridge {

/**
 * @brief Redis client abstract interface
 * @details Covers the commands the bridge needs: list queue operations,
 * the status key and connection management. Implemented over hiredis by
 * RedisClientImpl and by in-memory fakes in tests.
 */
class RedisClient {
public:
  virtual ~RedisClient() = default;

  // =============================================================================
  // Connection management
  // =============================================================================

  /**
   * @brief Connects to a Redis server
   * @param host server host
   * @param port server port
   * @param password AUTH password (empty for none)
   * @return true on success
   */
  virtual bool connect(const std::string &host, int port,
                       const std::string &password = "") = 0;

  /**
   * @brief Closes the connection
   */
  virtual void disconnect() = 0;

  /**
   * @brief Connection state
   * @return true when the last command did not fail at transport level
   */
  virtual bool isConnected() const = 0;

  /**
   * @brief Selects the logical database
   * @param db_index database number
   * @return true on success
   */
  virtual bool select(int db_index) = 0;

  // =============================================================================
  // Key-Value
  // =============================================================================

  /**
   * @brief Sets a value with a time to live
   * @param key key
   * @param value value
   * @param expire_seconds TTL in seconds
   * @return true on success
   */
  virtual bool setex(const std::string &key, const std::string &value,
                     int expire_seconds) = 0;

  /**
   * @brief Reads a value
   * @return the value, or empty string when the key does not exist
   */
  virtual std::string get(const std::string &key) = 0;

  // =============================================================================
  // List
  // =============================================================================

  /**
   * @brief Removes and returns the head of a list
   * @return the element, or empty string when the list is empty
   */
  virtual std::string lpop(const std::string &key) = 0;

  /**
   * @brief Blocking head pop with a bounded wait
   * @param key list key
   * @param timeout_seconds maximum wait, must be > 0
   * @return the element, or std::nullopt on timeout or transport failure
   */
  virtual std::optional<std::string> blpop(const std::string &key,
                                           int timeout_seconds) = 0;

  /**
   * @brief List length
   * @return length, or -1 when it could not be read
   */
  virtual int llen(const std::string &key) = 0;
};

} // namespace NemoBridge

#endif // REDIS_CLIENT_H
