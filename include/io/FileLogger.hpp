#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for SD-card or host FS.
 *
 *  © 2026 KaliPiMax — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace kpm {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Appends; never truncates an existing journal.
 *  * Flushes automatically once 4 kB are buffered.
 *  * Non-copyable, non-movable (sole owner of the FILE*).
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable-----------------------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace kpm
