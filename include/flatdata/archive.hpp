#pragma once

#include <memory>
#include <optional>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "array_view.hpp"
#include "external_vector.hpp"
#include "multi_vector.hpp"
#include "storage.hpp"

namespace flatdata {

enum class ResourceKind { Struct, Vector, MultiVector, RawData };

const char *toString(ResourceKind kind);

// Declaration of one archive member, as emitted by the schema compiler
struct ResourceSpec {
  std::string name;
  std::string schema;
  ResourceKind kind = ResourceKind::RawData;
  bool optional = false;
  size_t recordSize = 0; // Struct size, checked for struct members (0 = unchecked)
};

// Name of the signature resource of an archive
inline std::string signatureName(std::string_view archiveName) {
  return std::string(archiveName) + ".archive";
}

// Read side of an archive. Concrete archives derive from it, declare their
// members and expose typed accessors on top of the protected helpers.
//
// All members are read and schema-checked when the archive is loaded, so a
// successfully opened archive never fails on member access.
class Archive {
public:
  virtual ~Archive() = default;

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept = default;
  Archive &operator=(Archive &&) noexcept = default;

  const std::string &name() const { return name_; }

  // True if the member was found in storage (always true for required members)
  bool has(const std::string &member) const;

  // Raw bytes of a member; empty span for absent optional members
  std::span<const uint8_t> resource(const std::string &member) const;

  // One line per member: name, kind, size in bytes or "absent"
  std::string describe() const;

protected:
  Archive() = default;

  // Check the signature resource and load every member
  bool load(std::shared_ptr<ResourceStorage> storage, std::string_view name,
            std::string_view schema, std::span<const ResourceSpec> members,
            ResourceStorageError *outError);

  template <StructType T> std::optional<View<T>> structure(const std::string &member) const {
    const Member &m = find(member);
    if (!m.data) {
      return std::nullopt;
    }
    return View<T>(*m.data, 0);
  }

  template <StructType T> std::optional<ArrayView<T>> vector(const std::string &member) const {
    const Member &m = find(member);
    if (!m.data) {
      return std::nullopt;
    }
    return ArrayView<T>(*m.data);
  }

  // MV is a MultiArrayView instantiation
  template <typename MV> std::optional<MV> multiVector(const std::string &member) const {
    const Member &m = find(member);
    if (!m.data || !m.index) {
      return std::nullopt;
    }
    return MV(ArrayView<typename MV::index_type>(*m.index), *m.data);
  }

  std::optional<std::span<const uint8_t>> rawData(const std::string &member) const {
    return find(member).data;
  }

private:
  struct Member {
    ResourceSpec spec;
    std::optional<std::span<const uint8_t>> data;
    std::optional<std::span<const uint8_t>> index; // Multivector members only
  };

  bool loadMember(const ResourceSpec &spec, ResourceStorageError *outError);
  const Member &find(const std::string &member) const;

  std::shared_ptr<ResourceStorage> storage_;
  std::string name_;
  std::vector<Member> members_;
};

// Write side of an archive. Creating a builder writes the signature resource,
// and fails if it already exists. Every member is then either written in one
// go (set*) or streamed (start*), exactly once.
class ArchiveBuilder {
public:
  virtual ~ArchiveBuilder() = default;

  // Delete copy, enable move
  ArchiveBuilder(const ArchiveBuilder &) = delete;
  ArchiveBuilder &operator=(const ArchiveBuilder &) = delete;
  ArchiveBuilder(ArchiveBuilder &&) noexcept = default;
  ArchiveBuilder &operator=(ArchiveBuilder &&) noexcept = default;

  const std::string &name() const { return name_; }

  // Required members that were neither set nor started yet
  std::vector<std::string> missingMembers() const;

protected:
  ArchiveBuilder() = default;

  bool init(std::shared_ptr<ResourceStorage> storage, std::string_view name,
            std::string_view schema, std::span<const ResourceSpec> members,
            ResourceStorageError *outError);

  // Buffered write of a struct, vector or raw data member
  bool setResource(const std::string &member, std::span<const uint8_t> data,
                   ResourceStorageError *outError);

  template <StructType T>
  std::optional<ExternalVector<T>> startVector(const std::string &member,
                                               ResourceStorageError *outError) {
    const ResourceSpec &spec = claim(member, ResourceKind::Vector);
    if (!markUsed(member, outError)) {
      return std::nullopt;
    }
    return std::optional<ExternalVector<T>>(std::in_place, storage_, spec.name, spec.schema);
  }

  template <typename MV>
  std::optional<MV> startMultiVector(const std::string &member, ResourceStorageError *outError) {
    const ResourceSpec &spec = claim(member, ResourceKind::MultiVector);
    if (!markUsed(member, outError)) {
      return std::nullopt;
    }
    return std::optional<MV>(std::in_place, storage_, spec.name, spec.schema);
  }

private:
  // Spec of a member; throws std::logic_error for undeclared members or a kind mismatch
  const ResourceSpec &claim(const std::string &member, std::optional<ResourceKind> kind) const;
  bool markUsed(const std::string &member, ResourceStorageError *outError);

  std::shared_ptr<ResourceStorage> storage_;
  std::string name_;
  std::vector<ResourceSpec> members_;
  std::set<std::string> used_;
};

} // namespace flatdata
