#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/file_record.hpp"

/**
 * @brief File-backed JSON array of FileRecords
 *
 * Layout is "[\n" followed by one JSON object per line separated by ",\n" and a closing "\n]".
 * An empty store is "[\n]". Appends write at the byte offset of the closing bracket, which the
 * sink tracks itself, so the file is a valid JSON document after every write.
 *
 * One writer per store.
 */
class ResultSink
{
public:
    explicit ResultSink(std::string path);

    /**
     * @brief Create or truncate the store as an empty array
     * @throws StoreError on I/O failure
     */
    void initialize();

    /**
     * @brief Adopt an existing store, or initialize a missing one
     *
     * The existing array is parsed and rewritten in canonical layout.
     * @throws StoreError if the file is not a JSON array or cannot be rewritten
     */
    void open();

    /**
     * @brief Write records to the store
     * @param records Records to write; an empty list leaves the store untouched
     * @param append true to add after the existing records, false to replace them
     * @throws StoreError on I/O failure
     */
    void write(const std::vector<FileRecord> &records, bool append);

    /**
     * @brief Parse the whole store
     * @throws StoreError if the file cannot be read or parsed
     */
    std::vector<FileRecord> readAll() const;

    size_t getRecordCount() const;
    const std::string &getPath() const { return path_; }

private:
    void ensureOpen();
    void replaceContents(const std::vector<std::string> &entries);
    void appendEntries(const std::vector<std::string> &entries);

    std::string path_;
    mutable std::mutex mutex_;
    std::optional<uint64_t> close_offset_; // position of the closing "]" or "\n]"
    size_t record_count_ = 0;
};
