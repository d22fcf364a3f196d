#include "bucket/file_document.hpp"
#include "bucket/gridfs_error.hpp"
#include <limits>
#include <stdexcept>

namespace gridfs::bucket {

int64_t chunk_count(int64_t length, int32_t chunk_size) {
  if (length <= 0) {
    return 0;
  }
  return (length + chunk_size - 1) / chunk_size;
}

std::size_t expected_chunk_size(int64_t length, int32_t chunk_size, int64_t n) {
  int64_t count = chunk_count(length, chunk_size);
  if (n < 0 || n >= count) {
    throw std::out_of_range("chunk " + std::to_string(n) + " is past the last chunk");
  }
  if (n < count - 1) {
    return static_cast<std::size_t>(chunk_size);
  }
  // Last chunk carries the remainder, or a full chunk when the length divides evenly
  return static_cast<std::size_t>(length - (count - 1) * chunk_size);
}


//==============================================
// FILE DOCUMENT
//==============================================

bson::Document FileDocument::to_document() const {
  bson::Document document{
    {field::ID, id},
    {field::LENGTH, length},
    {field::CHUNK_SIZE, chunk_size},
    {field::UPLOAD_DATE, upload_date},
    {field::MD5, md5},
    {field::FILENAME, filename}
  };

  if (extras.content_type) {
    document.append(field::CONTENT_TYPE, *extras.content_type);
  }
  if (extras.metadata) {
    document.append(field::METADATA, *extras.metadata);
  }
  if (extras.aliases) {
    bson::Array aliases;
    for (const auto& alias : *extras.aliases) {
      aliases.emplace_back(alias);
    }
    document.append(field::ALIASES, std::move(aliases));
  }
  return document;
}

FileDocument FileDocument::from_document(const bson::Document& document) {
  FileDocument file;
  try {
    file.id = document.get(field::ID);
    file.length = document.get_integer(field::LENGTH);

    int64_t chunk_size = document.get_integer(field::CHUNK_SIZE);
    if (chunk_size <= 0 || chunk_size > std::numeric_limits<int32_t>::max()) {
      throw GridFSError("Malformed file document: invalid chunk size " + std::to_string(chunk_size));
    }
    file.chunk_size = static_cast<int32_t>(chunk_size);

    if (file.length < 0) {
      throw GridFSError("Malformed file document: negative length");
    }

    if (const bson::Value* date = document.find(field::UPLOAD_DATE)) {
      file.upload_date = date->as<bson::DateTime>();
    }
    if (const bson::Value* md5 = document.find(field::MD5)) {
      file.md5 = md5->as<std::string>();
    }
    if (const bson::Value* filename = document.find(field::FILENAME)) {
      if (!filename->is_null()) {
        file.filename = filename->as<std::string>();
      }
    }
    if (const bson::Value* content_type = document.find(field::CONTENT_TYPE)) {
      file.extras.content_type = content_type->as<std::string>();
    }
    if (const bson::Value* metadata = document.find(field::METADATA)) {
      file.extras.metadata = metadata->as<bson::Document>();
    }
    if (const bson::Value* aliases = document.find(field::ALIASES)) {
      std::vector<std::string> names;
      for (const auto& alias : aliases->as<bson::Array>()) {
        names.push_back(alias.as<std::string>());
      }
      file.extras.aliases = std::move(names);
    }
  } catch (const bson::BsonError& e) {
    throw GridFSError(std::string("Malformed file document: ") + e.what());
  }
  return file;
}


//==============================================
// CHUNK DOCUMENT
//==============================================

bson::Document ChunkDocument::to_document() const {
  bson::Value index = n <= std::numeric_limits<int32_t>::max()
    ? bson::Value(static_cast<int32_t>(n))
    : bson::Value(n);

  return bson::Document{
    {field::ID, bson::ObjectId::generate()},
    {field::FILES_ID, files_id},
    {field::N, index},
    {field::DATA, encode_chunk(data.data(), data.size())}
  };
}

ChunkDocument ChunkDocument::from_document(const bson::Document& document) {
  ChunkDocument chunk;
  try {
    chunk.files_id = document.get(field::FILES_ID);
    chunk.n = document.get_integer(field::N);
    chunk.data = decode_chunk(document.get(field::DATA));
  } catch (const bson::BsonError& e) {
    throw GridFSError(std::string("Malformed chunk document: ") + e.what());
  }
  return chunk;
}


//==============================================
// CHUNK CODEC
//==============================================

bson::Binary encode_chunk(const uint8_t* data, std::size_t length) {
  return bson::Binary(std::vector<uint8_t>(data, data + length));
}

std::vector<uint8_t> decode_chunk(const bson::Value& field) {
  return field.as<bson::Binary>().data;
}

} // namespace gridfs::bucket
