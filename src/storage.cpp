#include <array>
#include <initializer_list>
#include <format>
#include <stdexcept>

#include <flatdata/endian.hpp>
#include <flatdata/log.hpp>
#include <flatdata/schema.hpp>
#include <flatdata/storage.hpp>

namespace flatdata {

namespace {

constexpr std::array<uint8_t, PADDING_SIZE> zeroPadding{};

std::span<const uint8_t> asBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
}

} // namespace

bool ResourceStorage::exists(const std::string &name) const {
  return blobExists(name);
}

std::optional<std::string> ResourceStorage::readSchema(const std::string &name,
                                                       ResourceStorageError *outError) {
  const std::string key = schemaKey(name);
  if (!blobExists(key)) {
    fail(outError, ResourceStorageError::make(ErrorKind::MissingSchema, name));
    return std::nullopt;
  }

  auto blob = readBlob(key, outError);
  if (!blob) {
    return std::nullopt;
  }

  std::string schema(reinterpret_cast<const char *>(blob->data()), blob->size());
  if (!isValidUtf8(schema)) {
    fail(outError, ResourceStorageError::make(ErrorKind::Utf8Error, name,
                                              "stored schema is not valid UTF-8"));
    return std::nullopt;
  }
  return schema;
}

std::optional<std::span<const uint8_t>> ResourceStorage::read(const std::string &name,
                                                              std::string_view expectedSchema,
                                                              ResourceStorageError *outError) {
  auto schema = readSchema(name, outError);
  if (!schema) {
    return std::nullopt;
  }

  if (!schemasEqual(expectedSchema, *schema)) {
    logger().debug("schema mismatch for resource {}", name);
    fail(outError,
         ResourceStorageError::wrongSignature(name, schemaDiff(expectedSchema, *schema)));
    return std::nullopt;
  }

  if (!blobExists(name)) {
    fail(outError, ResourceStorageError::make(ErrorKind::MissingData, name,
                                              "schema present but data missing"));
    return std::nullopt;
  }

  auto blob = readBlob(name, outError);
  if (!blob) {
    return std::nullopt;
  }

  if (blob->size() < SIZE_HEADER + PADDING_SIZE) {
    fail(outError, ResourceStorageError::make(
                       ErrorKind::UnexpectedDataSize, name,
                       std::format("blob of {} bytes is smaller than its framing", blob->size())));
    return std::nullopt;
  }

  uint64_t size = readSizeHeader(blob->data());
  if (size != blob->size() - SIZE_HEADER - PADDING_SIZE) {
    fail(outError, ResourceStorageError::make(
                       ErrorKind::UnexpectedDataSize, name,
                       std::format("recorded size {} but blob holds {} data bytes", size,
                                   blob->size() - SIZE_HEADER - PADDING_SIZE)));
    return std::nullopt;
  }

  logger().debug("read resource {} ({} bytes)", name, size);
  return blob->subspan(SIZE_HEADER, static_cast<size_t>(size));
}

bool ResourceStorage::write(const std::string &name, std::string_view schema,
                            std::span<const uint8_t> data, ResourceStorageError *outError) {
  if (writing_) {
    throw std::logic_error(
        std::format("concurrent write to resource storage while writing {}", name));
  }
  writing_ = true;
  struct Reset {
    bool &flag;
    ~Reset() { flag = false; }
  } reset{writing_};

  const std::string schemaName = schemaKey(name);
  for (const std::string *key : {&name, &schemaName}) {
    std::string reason;
    if (!canReplaceBlob(*key, &reason)) {
      return fail(outError, ResourceStorageError::io(name, std::move(reason)));
    }
  }

  auto tagged = [&](bool ok) {
    if (!ok && outError) {
      outError->resourceName = name;
    }
    return ok;
  };

  if (blobExists(schemaName) && !tagged(removeBlob(schemaName, outError))) {
    return false;
  }

  std::array<uint8_t, SIZE_HEADER> header;
  writeSizeHeader(header.data(), data.size());

  // Data first: a present schema implies complete data
  const std::array<std::span<const uint8_t>, 3> dataParts = {
      std::span<const uint8_t>(header), data, std::span<const uint8_t>(zeroPadding)};
  if (!tagged(writeBlob(name, dataParts, outError))) {
    return false;
  }

  const std::array<std::span<const uint8_t>, 1> schemaParts = {asBytes(schema)};
  if (!tagged(writeBlob(schemaName, schemaParts, outError))) {
    return false;
  }

  logger().debug("wrote resource {} ({} bytes)", name, data.size());
  return true;
}

} // namespace flatdata
