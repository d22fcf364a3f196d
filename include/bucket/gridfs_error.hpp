#ifndef GRIDFS_BUCKET_GRIDFS_ERROR_HPP
#define GRIDFS_BUCKET_GRIDFS_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace gridfs::bucket {

class GridFSError : public std::runtime_error {
public:
    explicit GridFSError(const std::string& message) 
        : std::runtime_error(message) {}
};

// A document store call failed underneath a stream or bucket operation
class StorageError : public GridFSError {
public:
    enum class Phase {
        ChunkFlush,
        FileInsert,
        Abort,
        ChunkQuery,
        FileQuery,
        Delete,
        IndexSetup
    };

    StorageError(Phase phase, const std::string& file_id, const std::string& message)
        : GridFSError("Storage error during " + std::string(phase_name(phase))
                      + " for file " + file_id + ": " + message)
        , phase_(phase)
        , file_id_(file_id) {}

    Phase phase() const { return phase_; }
    const std::string& file_id() const { return file_id_; }

    static const char* phase_name(Phase phase) {
        switch (phase) {
            case Phase::ChunkFlush: return "chunk flush";
            case Phase::FileInsert: return "file insert";
            case Phase::Abort:      return "abort";
            case Phase::ChunkQuery: return "chunk query";
            case Phase::FileQuery:  return "file query";
            case Phase::Delete:     return "delete";
            case Phase::IndexSetup: return "index setup";
        }
        return "unknown phase";
    }

private:
    Phase phase_;
    std::string file_id_;
};

class ChunkSequenceError : public GridFSError {
public:
    explicit ChunkSequenceError(const std::string& message) 
        : GridFSError("ChunkIsMissing: " + message) {}
};

class ChunkSizeError : public GridFSError {
public:
    ChunkSizeError(int64_t n, std::size_t actual, std::size_t expected, const std::string& file_id)
        : GridFSError("ChunkIsWrongSize: chunk " + std::to_string(n) + " from file with id " + file_id
                      + " has incorrect size " + std::to_string(actual)
                      + ", expected " + std::to_string(expected)) {}
};

class UsageError : public GridFSError {
public:
    explicit UsageError(const std::string& message) 
        : GridFSError("Usage error: " + message) {}
};

class FileNotFoundError : public GridFSError {
public:
    explicit FileNotFoundError(const std::string& file_id) 
        : GridFSError("FileNotFound: no file found for id '" + file_id + "'") {}
};

} // namespace gridfs::bucket

#endif // GRIDFS_BUCKET_GRIDFS_ERROR_HPP
