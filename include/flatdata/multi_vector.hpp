#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "array_view.hpp"
#include "log.hpp"
#include "storage.hpp"
#include "vector.hpp"

namespace flatdata {

// Index entry of a multivector: one cumulative payload offset of `Bits` bits
template <unsigned Bits> struct IndexType {
  static_assert(Bits >= 1 && Bits <= 64, "index width must be in 1..64");

  static constexpr std::string_view NAME = "IndexType";
  static constexpr unsigned bitWidth = Bits;
  static constexpr size_t sizeInBytes = (Bits + 7) / 8;
  static constexpr uint64_t maxValue = bitMask(Bits);
  static constexpr Field<uint64_t> value{"value", 0, Bits};
};

using IndexType32 = IndexType<32>;

namespace detail {

template <typename S, typename... Ts> constexpr size_t variantIndex() {
  constexpr bool matches[] = {std::is_same_v<S, Ts>...};
  for (size_t i = 0; i < sizeof...(Ts); ++i) {
    if (matches[i]) {
      return i;
    }
  }
  return sizeof...(Ts);
}

template <typename S, typename... Ts> constexpr size_t occurrences() {
  return (size_t{0} + ... + (std::is_same_v<S, Ts> ? 1 : 0));
}

inline std::string indexName(const std::string &name) { return name + "_index"; }
inline std::string indexSchema(std::string_view schema) {
  return std::format("index({})", schema);
}

} // namespace detail

// Read side of a multivector: position i holds the items stored in payload
// range [index[i], index[i + 1]), each item a tag byte followed by the record
// of the variant with that tag.
template <typename Index, StructType... Ts> class MultiArrayView {
public:
  using Item = std::variant<View<Ts>...>;
  using index_type = Index;

  static constexpr std::array<std::string_view, sizeof...(Ts)> variantNames = {Ts::NAME...};

  MultiArrayView() = default;
  MultiArrayView(ArrayView<Index> index, std::span<const uint8_t> payload)
      : index_(index), payload_(payload) {}

  // Number of logical positions
  size_t size() const { return index_.empty() ? 0 : index_.size() - 1; }
  bool empty() const { return size() == 0; }

  // Items at position, in insertion order
  std::vector<Item> at(size_t position) const {
    std::vector<Item> items;
    forEachItem(position, [&](Item item) { items.push_back(std::move(item)); });
    return items;
  }

  std::vector<Item> operator[](size_t position) const { return at(position); }

  // Call visitor with the typed View<S> of every item at position
  template <typename Visitor> void forEach(size_t position, Visitor &&visitor) const {
    forEachItem(position, [&](const Item &item) { std::visit(visitor, item); });
  }

  static std::string_view variantName(const Item &item) { return variantNames[item.index()]; }

  // Payload offset recorded for position (position == size() gives the total)
  uint64_t offset(size_t position) const { return index_.at(position).get(Index::value); }

  ArrayView<Index> index() const { return index_; }
  std::span<const uint8_t> payload() const { return payload_; }

private:
  static constexpr std::array<size_t, sizeof...(Ts)> variantSizes = {Ts::sizeInBytes...};

  template <typename Callback> void forEachItem(size_t position, Callback &&callback) const {
    if (position >= size()) {
      throw std::out_of_range(
          std::format("multivector position {} out of range (size {})", position, size()));
    }

    uint64_t begin = offset(position);
    uint64_t end = offset(position + 1);
    if (begin > end || end > payload_.size()) {
      throw CorruptDataError(std::format("multivector position {} has invalid range [{}, {})",
                                         position, begin, end));
    }

    size_t pos = static_cast<size_t>(begin);
    while (pos < end) {
      uint8_t tag = payload_[pos];
      if (tag >= sizeof...(Ts)) {
        throw CorruptDataError(
            std::format("unknown multivector tag {} at payload offset {}", tag, pos));
      }
      if (pos + 1 + variantSizes[tag] > end) {
        throw CorruptDataError(
            std::format("multivector item at payload offset {} exceeds its position", pos));
      }
      callback(makeItem(tag, pos + 1, std::index_sequence_for<Ts...>{}));
      pos += 1 + variantSizes[tag];
    }
  }

  template <size_t... I>
  Item makeItem(uint8_t tag, size_t offset, std::index_sequence<I...>) const {
    Item item;
    ((tag == I ? (item = Item(std::in_place_index<I>, payload_, offset), true) : false) || ...);
    return item;
  }

  ArrayView<Index> index_;
  std::span<const uint8_t> payload_;
};

// Write side of a multivector: a sequence of logical positions, each holding
// any number of items of the variant types Ts. The tag of a variant is its
// position in Ts. Backed by the payload resource `name` and the index resource
// `name_index`; both are written exactly once by close().
template <typename Index, StructType... Ts> class MultiVector {
  static_assert(sizeof...(Ts) >= 1 && sizeof...(Ts) <= 256, "1..256 variants supported");
  static_assert(((detail::occurrences<Ts, Ts...>() == 1) && ...), "variant types must differ");

public:
  using view_type = MultiArrayView<Index, Ts...>;

  // Appends items to the position currently being built
  class ItemBuilder {
  public:
    explicit ItemBuilder(MultiVector *owner) : owner_(owner) {}

    // Append one item of variant S and return a view over its (zeroed) record.
    // The view is valid until the next item is added.
    template <typename S> ViewMut<S> add() { return owner_->template addItem<S>(); }

  private:
    MultiVector *owner_;
  };

  MultiVector(std::shared_ptr<ResourceStorage> storage, std::string name, std::string schema)
      : storage_(std::move(storage)), name_(std::move(name)), schema_(std::move(schema)) {
    // Index starts with offset 0
    index_.append(Index::sizeInBytes);
  }

  ~MultiVector() {
    if (!storage_ || closed_) {
      return;
    }
    logger().warn("multivector {} was not closed, closing it on destruction", name_);
    ResourceStorageError error;
    if (!close(&error)) {
      logger().error("failed to close multivector {}: {}", name_, error.toString());
    }
  }

  // Delete copy, enable move
  MultiVector(const MultiVector &) = delete;
  MultiVector &operator=(const MultiVector &) = delete;
  MultiVector(MultiVector &&other) noexcept
      : storage_(std::move(other.storage_)), name_(std::move(other.name_)),
        schema_(std::move(other.schema_)), payload_(std::move(other.payload_)),
        index_(std::move(other.index_)), positions_(other.positions_), closed_(other.closed_) {
    other.closed_ = true;
  }
  MultiVector &operator=(MultiVector &&) = delete;

  // Builder for the items of the current position
  ItemBuilder grow() {
    ensureOpen();
    return ItemBuilder(this);
  }

  // Shortcut for grow().add<S>()
  template <typename S> ViewMut<S> add() { return addItem<S>(); }

  // Record the end of the current position. Fails with TooBig if the payload
  // offset does not fit into the index width.
  bool finishItem(ResourceStorageError *outError = nullptr) {
    ensureOpen();
    size_t offset = payload_.size();
    if (offset > Index::maxValue) {
      return fail(outError, ResourceStorageError::tooBig(name_, offset));
    }
    size_t entry = index_.append(Index::sizeInBytes);
    writeBits(index_.storage().data() + entry, Index::value.offset, Index::bitWidth, offset);
    ++positions_;
    return true;
  }

  // Number of finished positions
  size_t size() const { return positions_; }
  bool isOpen() const { return !closed_; }
  const std::string &name() const { return name_; }

  // Finish a pending position, write payload and index, and return a view over
  // the stored data. The multivector is unusable afterwards.
  std::optional<view_type> close(ResourceStorageError *outError = nullptr) {
    ensureOpen();
    if (payload_.size() > lastOffset()) {
      logger().debug("multivector {}: finishing pending position on close", name_);
      if (!finishItem(outError)) {
        closed_ = true;
        return std::nullopt;
      }
    }
    closed_ = true;

    const std::string indexName = detail::indexName(name_);
    const std::string indexSchema = detail::indexSchema(schema_);
    bool written = storage_->write(name_, schema_, payload_.bytes(), outError) &&
                   storage_->write(indexName, indexSchema, index_.bytes(), outError);
    payload_.release();
    index_.release();
    if (!written) {
      return std::nullopt;
    }

    auto payload = storage_->read(name_, schema_, outError);
    if (!payload) {
      return std::nullopt;
    }
    auto index = storage_->read(indexName, indexSchema, outError);
    if (!index) {
      return std::nullopt;
    }
    logger().debug("closed multivector {} with {} positions", name_, positions_);
    return view_type(ArrayView<Index>(*index), *payload);
  }

private:
  template <typename S> ViewMut<S> addItem() {
    constexpr size_t tag = detail::variantIndex<S, Ts...>();
    static_assert(tag < sizeof...(Ts), "type is not a variant of this multivector");
    ensureOpen();

    size_t offset = payload_.append(1 + S::sizeInBytes);
    payload_.storage()[offset] = static_cast<uint8_t>(tag);
    return ViewMut<S>(payload_.storage(), offset + 1);
  }

  uint64_t lastOffset() {
    size_t entry = index_.size() - Index::sizeInBytes;
    return readBits(index_.storage().data() + entry, Index::value.offset, Index::bitWidth);
  }

  void ensureOpen() const {
    if (closed_) {
      throw std::logic_error(std::format("multivector {} is already closed", name_));
    }
  }

  std::shared_ptr<ResourceStorage> storage_;
  std::string name_;
  std::string schema_;
  detail::GrowthBuffer payload_;
  detail::GrowthBuffer index_;
  size_t positions_ = 0;
  bool closed_ = false;
};

} // namespace flatdata
