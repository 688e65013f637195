#include <algorithm>
#include <format>

#include <flatdata/archive.hpp>
#include <flatdata/log.hpp>

namespace flatdata {

const char *toString(ResourceKind kind) {
  switch (kind) {
  case ResourceKind::Struct:
    return "struct";
  case ResourceKind::Vector:
    return "vector";
  case ResourceKind::MultiVector:
    return "multivector";
  case ResourceKind::RawData:
    return "raw_data";
  }
  return "unknown";
}

bool Archive::load(std::shared_ptr<ResourceStorage> storage, std::string_view name,
                   std::string_view schema, std::span<const ResourceSpec> members,
                   ResourceStorageError *outError) {
  storage_ = std::move(storage);
  name_ = std::string(name);
  members_.clear();

  const std::string signature = signatureName(name);
  if (!storage_->exists(signature)) {
    return fail(outError, ResourceStorageError::make(ErrorKind::Missing, signature,
                                                     "archive signature not found"));
  }
  if (!storage_->read(signature, schema, outError)) {
    return false;
  }

  members_.reserve(members.size());
  for (const auto &spec : members) {
    if (!loadMember(spec, outError)) {
      return false;
    }
  }

  logger().info("opened archive {} ({} members)", name_, members_.size());
  return true;
}

bool Archive::loadMember(const ResourceSpec &spec, ResourceStorageError *outError) {
  Member member{spec, std::nullopt, std::nullopt};

  if (spec.kind == ResourceKind::MultiVector) {
    const std::string indexName = detail::indexName(spec.name);
    bool hasData = storage_->exists(spec.name);
    bool hasIndex = storage_->exists(indexName);
    if (hasData != hasIndex) {
      return fail(outError, ResourceStorageError::make(
                                ErrorKind::MissingData, spec.name,
                                hasData ? "multivector index is missing"
                                        : "multivector payload is missing"));
    }
    if (!hasData && spec.optional) {
      members_.push_back(std::move(member));
      return true;
    }

    member.data = storage_->read(spec.name, spec.schema, outError);
    if (!member.data) {
      return false;
    }
    member.index = storage_->read(indexName, detail::indexSchema(spec.schema), outError);
    if (!member.index) {
      return false;
    }
  } else {
    if (spec.optional && !storage_->exists(spec.name) &&
        !storage_->exists(ResourceStorage::schemaKey(spec.name))) {
      members_.push_back(std::move(member));
      return true;
    }

    member.data = storage_->read(spec.name, spec.schema, outError);
    if (!member.data) {
      return false;
    }
    if (spec.kind == ResourceKind::Struct && member.data->size() < spec.recordSize) {
      return fail(outError, ResourceStorageError::make(
                                ErrorKind::UnexpectedDataSize, spec.name,
                                std::format("struct needs {} bytes but resource holds {}",
                                            spec.recordSize, member.data->size())));
    }
  }

  members_.push_back(std::move(member));
  return true;
}

const Archive::Member &Archive::find(const std::string &member) const {
  auto it = std::find_if(members_.begin(), members_.end(),
                         [&](const Member &m) { return m.spec.name == member; });
  if (it == members_.end()) {
    throw std::logic_error(std::format("archive {} has no member {}", name_, member));
  }
  return *it;
}

bool Archive::has(const std::string &member) const {
  return find(member).data.has_value();
}

std::span<const uint8_t> Archive::resource(const std::string &member) const {
  const Member &m = find(member);
  return m.data ? *m.data : std::span<const uint8_t>();
}

std::string Archive::describe() const {
  std::string result = std::format("archive {}\n", name_);
  for (const auto &member : members_) {
    if (member.data) {
      result += std::format("  {} ({}): {} bytes\n", member.spec.name,
                            toString(member.spec.kind), member.data->size());
    } else {
      result += std::format("  {} ({}): absent\n", member.spec.name, toString(member.spec.kind));
    }
  }
  return result;
}

bool ArchiveBuilder::init(std::shared_ptr<ResourceStorage> storage, std::string_view name,
                          std::string_view schema, std::span<const ResourceSpec> members,
                          ResourceStorageError *outError) {
  const std::string signature = signatureName(name);
  if (storage->exists(signature)) {
    return fail(outError, ResourceStorageError::io(signature, "archive already exists"));
  }
  if (!storage->write(signature, schema, {}, outError)) {
    return false;
  }

  storage_ = std::move(storage);
  name_ = std::string(name);
  members_.assign(members.begin(), members.end());
  used_.clear();

  logger().info("created archive {}", name_);
  return true;
}

bool ArchiveBuilder::setResource(const std::string &member, std::span<const uint8_t> data,
                                 ResourceStorageError *outError) {
  const ResourceSpec &spec = claim(member, std::nullopt);
  if (spec.kind == ResourceKind::MultiVector) {
    throw std::logic_error(std::format("multivector {} can only be streamed", member));
  }
  if (!markUsed(member, outError)) {
    return false;
  }
  return storage_->write(spec.name, spec.schema, data, outError);
}

std::vector<std::string> ArchiveBuilder::missingMembers() const {
  std::vector<std::string> missing;
  for (const auto &spec : members_) {
    if (!spec.optional && used_.find(spec.name) == used_.end()) {
      missing.push_back(spec.name);
    }
  }
  return missing;
}

const ResourceSpec &ArchiveBuilder::claim(const std::string &member,
                                          std::optional<ResourceKind> kind) const {
  auto it = std::find_if(members_.begin(), members_.end(),
                         [&](const ResourceSpec &spec) { return spec.name == member; });
  if (it == members_.end()) {
    throw std::logic_error(std::format("archive {} has no member {}", name_, member));
  }
  if (kind && it->kind != *kind) {
    throw std::logic_error(std::format("member {} is a {}, not a {}", member,
                                       toString(it->kind), toString(*kind)));
  }
  return *it;
}

bool ArchiveBuilder::markUsed(const std::string &member, ResourceStorageError *outError) {
  if (!used_.insert(member).second) {
    return fail(outError, ResourceStorageError::io(member, "resource already set"));
  }
  return true;
}

} // namespace flatdata
