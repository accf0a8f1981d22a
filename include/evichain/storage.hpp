#ifndef EVICHAIN_STORAGE_HPP
#define EVICHAIN_STORAGE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace evichain {

/**
 * @brief Key/value persistence used by the chain store and screenshot capture.
 *
 * Keys are '/'-separated paths relative to the storage root. Implementations
 * must make write() atomic (readers see either the old or the new content)
 * and serialize concurrent writers of the same key. Failures are reported
 * by throwing StorageFailure.
 */
class Storage {
public:
  virtual ~Storage() = default;

  /// Content stored under @p key, or std::nullopt if there is none.
  virtual std::optional<std::string> read(const std::string &key) = 0;

  /// Create or atomically replace the content under @p key.
  virtual void write(const std::string &key, const std::string &bytes) = 0;

  /**
   * @brief Store @p bytes under @p key only if nothing is stored there yet.
   *
   * The check and the store are one atomic step. Readers never see partial
   * content.
   * @return false if @p key already existed; its content is left untouched.
   */
  virtual bool create(const std::string &key, const std::string &bytes) = 0;

  virtual bool exists(const std::string &key) = 0;

  /**
   * @brief Names of the entries directly under @p prefix ("" for the root).
   *
   * Returns an empty list if the prefix does not exist.
   */
  virtual std::vector<std::string> list(const std::string &prefix) = 0;

  /// Location of @p key as seen outside the storage layer.
  virtual std::string resolve(const std::string &key) const = 0;
};

/**
 * @brief Storage backed by a directory tree.
 *
 * Both write() and create() fill a temporary file in the target directory
 * and fsync it. write() renames it over the target. Writers of the same key
 * are serialized by an in-process mutex and an exclusive flock() on
 * "<key>.lock", so separate processes are excluded as well. write() is meant
 * for the few keys that are rewritten in place (chain files).
 *
 * create() hard-links the temporary file to the target, which fails if the
 * target exists. It needs no lock, so it leaves no lock file or mutex behind
 * for the many write-once keys (screenshots, exports).
 */
class FileStorage : public Storage {
public:
  explicit FileStorage(std::string root);

  std::optional<std::string> read(const std::string &key) override;
  void write(const std::string &key, const std::string &bytes) override;
  bool create(const std::string &key, const std::string &bytes) override;
  bool exists(const std::string &key) override;
  std::vector<std::string> list(const std::string &prefix) override;
  std::string resolve(const std::string &key) const override;

  const std::string &root() const { return root_; }

private:
  std::mutex &mutexFor(const std::string &key);

  std::string root_;
  std::mutex locksMutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> keyLocks_;
};

} // namespace evichain

#endif // EVICHAIN_STORAGE_HPP
