#pragma once

// Layout tables and archive classes for the coappearances graph, in the form
// the schema compiler emits them.

#include <array>
#include <memory>
#include <optional>
#include <string_view>

#include <flatdata/flatdata.hpp>

namespace coappearances {

namespace schema {

inline constexpr std::string_view META = R"(namespace coappearances { /**
 * Meta information about the book.
 */
struct Meta {
    title_ref : u32 : 32;
    author_ref : u32 : 32;
} }
namespace coappearances { @explicit_reference( Meta.title_ref, strings )
    @explicit_reference( Meta.author_ref, strings )
    meta : Meta; })";

inline constexpr std::string_view VERTICES = R"(namespace coappearances { /**
 * A character.
 */
struct Character {
    name_ref : u32 : 32;
} }
namespace coappearances { @explicit_reference( Character.name_ref, strings )
    vertices : vector< Character >; })";

inline constexpr std::string_view EDGES = R"(namespace coappearances { /**
 * An appearance of two characters in the same scene.
 *
 * count - multiplicity of the coappearance.
 * first_chapter_ref - a reference to the first chapter in which characters appear. How to get the
 * full range of chapters is described in `coappearances.cpp:read`.
 */
struct Coappearance {
    a_ref : u32 : 16;
    b_ref : u32 : 16;
    count : u32 : 16;
    first_chapter_ref: u32 : 16;
} }
namespace coappearances { @explicit_reference( Coappearance.a_ref, vertices )
    @explicit_reference( Coappearance.b_ref, vertices )
    @explicit_reference( Coappearance.first_chapter_ref, chapters )
    edges : vector< Coappearance >; })";

inline constexpr std::string_view CHAPTERS = R"(namespace coappearances { /**
 * A chapter in the book.
 */
struct Chapter {
    major: u8 : 4;
    minor: u8 : 7;
} }
namespace coappearances { chapters : vector< Chapter >; })";

inline constexpr std::string_view VERTICES_DATA = R"(namespace coappearances { /**
 * A nickname or an alternative name of a character.
 */
struct Nickname {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A description of a character.
 */
struct Description {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A relation of a character to another one.
 */
struct UnaryRelation {
    kind_ref: u32 : 32;
    to_ref: u32 : 16;
} }
namespace coappearances { /**
 * A relation of a character to two other characters.
 */
struct BinaryRelation {
    kind_ref: u32 : 32;
    to_a_ref: u32 : 16;
    to_b_ref: u32 : 16;
} }
namespace _builtin.multivector { struct IndexType32 { value : u64 : 32; } }
namespace coappearances { @explicit_reference( Nickname.ref, strings )
    @explicit_reference( Description.ref, strings )
    @explicit_reference( UnaryRelation.kind_ref, strings )
    @explicit_reference( UnaryRelation.to_ref, vertices )
    @explicit_reference( BinaryRelation.kind_ref, strings )
    @explicit_reference( BinaryRelation.to_a_ref, vertices )
    @explicit_reference( BinaryRelation.to_b_ref, vertices )
    vertices_data: multivector< 32, Nickname, Description, UnaryRelation, BinaryRelation >; })";

inline constexpr std::string_view VERTICES_DATA_INDEX = R"--(index(namespace coappearances { /**
 * A nickname or an alternative name of a character.
 */
struct Nickname {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A description of a character.
 */
struct Description {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A relation of a character to another one.
 */
struct UnaryRelation {
    kind_ref: u32 : 32;
    to_ref: u32 : 16;
} }
namespace coappearances { /**
 * A relation of a character to two other characters.
 */
struct BinaryRelation {
    kind_ref: u32 : 32;
    to_a_ref: u32 : 16;
    to_b_ref: u32 : 16;
} }
namespace _builtin.multivector { struct IndexType32 { value : u64 : 32; } }
namespace coappearances { @explicit_reference( Nickname.ref, strings )
    @explicit_reference( Description.ref, strings )
    @explicit_reference( UnaryRelation.kind_ref, strings )
    @explicit_reference( UnaryRelation.to_ref, vertices )
    @explicit_reference( BinaryRelation.kind_ref, strings )
    @explicit_reference( BinaryRelation.to_a_ref, vertices )
    @explicit_reference( BinaryRelation.to_b_ref, vertices )
    vertices_data: multivector< 32, Nickname, Description, UnaryRelation, BinaryRelation >; }))--";

inline constexpr std::string_view STRINGS =
    R"(namespace coappearances { // All strings contained in the data separated by `\0`.
    strings: raw_data; })";

inline constexpr std::string_view GRAPH = R"(namespace coappearances { /**
 * Meta information about the book.
 */
struct Meta {
    title_ref : u32 : 32;
    author_ref : u32 : 32;
} }
namespace coappearances { /**
 * A character.
 */
struct Character {
    name_ref : u32 : 32;
} }
namespace coappearances { /**
 * An appearance of two characters in the same scene.
 *
 * count - multiplicity of the coappearance.
 * first_chapter_ref - a reference to the first chapter in which characters appear. How to get the
 * full range of chapters is described in `coappearances.cpp:read`.
 */
struct Coappearance {
    a_ref : u32 : 16;
    b_ref : u32 : 16;
    count : u32 : 16;
    first_chapter_ref: u32 : 16;
} }
namespace coappearances { /**
 * A nickname or an alternative name of a character.
 */
struct Nickname {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A description of a character.
 */
struct Description {
    ref: u32 : 32;
} }
namespace coappearances { /**
 * A relation of a character to another one.
 */
struct UnaryRelation {
    kind_ref: u32 : 32;
    to_ref: u32 : 16;
} }
namespace coappearances { /**
 * A relation of a character to two other characters.
 */
struct BinaryRelation {
    kind_ref: u32 : 32;
    to_a_ref: u32 : 16;
    to_b_ref: u32 : 16;
} }
namespace _builtin.multivector { struct IndexType32 { value : u64 : 32; } }
namespace coappearances { /**
 * A chapter in the book.
 */
struct Chapter {
    major: u8 : 4;
    minor: u8 : 7;
} }
namespace coappearances { @bound_implicitly( characters: vertices, vertices_data )
archive Graph {
    @explicit_reference( Meta.title_ref, strings )
    @explicit_reference( Meta.author_ref, strings )
    meta : Meta;

    @explicit_reference( Character.name_ref, strings )
    vertices : vector< Character >;

    @explicit_reference( Coappearance.a_ref, vertices )
    @explicit_reference( Coappearance.b_ref, vertices )
    @explicit_reference( Coappearance.first_chapter_ref, chapters )
    edges : vector< Coappearance >;

    @explicit_reference( Nickname.ref, strings )
    @explicit_reference( Description.ref, strings )
    @explicit_reference( UnaryRelation.kind_ref, strings )
    @explicit_reference( UnaryRelation.to_ref, vertices )
    @explicit_reference( BinaryRelation.kind_ref, strings )
    @explicit_reference( BinaryRelation.to_a_ref, vertices )
    @explicit_reference( BinaryRelation.to_b_ref, vertices )
    vertices_data: multivector< 32, Nickname, Description, UnaryRelation, BinaryRelation >;

    chapters : vector< Chapter >;

    // All strings contained in the data separated by `\0`.
    strings: raw_data;
} })";

} // namespace schema

struct Meta {
  static constexpr std::string_view NAME = "Meta";
  static constexpr size_t sizeInBytes = 8;
  static constexpr flatdata::Field<uint32_t> title_ref{"title_ref", 0, 32};
  static constexpr flatdata::Field<uint32_t> author_ref{"author_ref", 32, 32};
};

struct Character {
  static constexpr std::string_view NAME = "Character";
  static constexpr size_t sizeInBytes = 4;
  static constexpr flatdata::Field<uint32_t> name_ref{"name_ref", 0, 32};
};

struct Coappearance {
  static constexpr std::string_view NAME = "Coappearance";
  static constexpr size_t sizeInBytes = 8;
  static constexpr flatdata::Field<uint32_t> a_ref{"a_ref", 0, 16};
  static constexpr flatdata::Field<uint32_t> b_ref{"b_ref", 16, 16};
  static constexpr flatdata::Field<uint32_t> count{"count", 32, 16};
  static constexpr flatdata::Field<uint32_t> first_chapter_ref{"first_chapter_ref", 48, 16};
};

struct Chapter {
  static constexpr std::string_view NAME = "Chapter";
  static constexpr size_t sizeInBytes = 2;
  static constexpr flatdata::Field<uint8_t> major{"major", 0, 4};
  static constexpr flatdata::Field<uint8_t> minor{"minor", 4, 7};
};

struct Nickname {
  static constexpr std::string_view NAME = "Nickname";
  static constexpr size_t sizeInBytes = 4;
  static constexpr flatdata::Field<uint32_t> ref{"ref", 0, 32};
};

struct Description {
  static constexpr std::string_view NAME = "Description";
  static constexpr size_t sizeInBytes = 4;
  static constexpr flatdata::Field<uint32_t> ref{"ref", 0, 32};
};

struct UnaryRelation {
  static constexpr std::string_view NAME = "UnaryRelation";
  static constexpr size_t sizeInBytes = 6;
  static constexpr flatdata::Field<uint32_t> kind_ref{"kind_ref", 0, 32};
  static constexpr flatdata::Field<uint32_t> to_ref{"to_ref", 32, 16};
};

struct BinaryRelation {
  static constexpr std::string_view NAME = "BinaryRelation";
  static constexpr size_t sizeInBytes = 8;
  static constexpr flatdata::Field<uint32_t> kind_ref{"kind_ref", 0, 32};
  static constexpr flatdata::Field<uint32_t> to_a_ref{"to_a_ref", 32, 16};
  static constexpr flatdata::Field<uint32_t> to_b_ref{"to_b_ref", 48, 16};
};

using VerticesData = flatdata::MultiVector<flatdata::IndexType32, Nickname, Description,
                                           UnaryRelation, BinaryRelation>;
using VerticesDataView = VerticesData::view_type;

inline const std::array<flatdata::ResourceSpec, 6> graphMembers = {{
    {"meta", std::string(schema::META), flatdata::ResourceKind::Struct, false,
     Meta::sizeInBytes},
    {"vertices", std::string(schema::VERTICES), flatdata::ResourceKind::Vector},
    {"edges", std::string(schema::EDGES), flatdata::ResourceKind::Vector},
    {"vertices_data", std::string(schema::VERTICES_DATA), flatdata::ResourceKind::MultiVector},
    {"chapters", std::string(schema::CHAPTERS), flatdata::ResourceKind::Vector},
    {"strings", std::string(schema::STRINGS), flatdata::ResourceKind::RawData},
}};

class Graph : public flatdata::Archive {
public:
  static constexpr std::string_view NAME = "Graph";

  static std::optional<Graph> open(std::shared_ptr<flatdata::ResourceStorage> storage,
                                   flatdata::ResourceStorageError *outError = nullptr) {
    Graph graph;
    if (!graph.load(std::move(storage), NAME, schema::GRAPH, graphMembers, outError)) {
      return std::nullopt;
    }
    return graph;
  }

  flatdata::View<Meta> meta() const { return *structure<Meta>("meta"); }
  flatdata::ArrayView<Character> vertices() const { return *vector<Character>("vertices"); }
  flatdata::ArrayView<Coappearance> edges() const { return *vector<Coappearance>("edges"); }
  VerticesDataView vertices_data() const {
    return *multiVector<VerticesDataView>("vertices_data");
  }
  flatdata::ArrayView<Chapter> chapters() const { return *vector<Chapter>("chapters"); }
  std::span<const uint8_t> strings() const { return *rawData("strings"); }

private:
  Graph() = default;
};

class GraphBuilder : public flatdata::ArchiveBuilder {
public:
  static std::optional<GraphBuilder> create(std::shared_ptr<flatdata::ResourceStorage> storage,
                                            flatdata::ResourceStorageError *outError = nullptr) {
    GraphBuilder builder;
    if (!builder.init(std::move(storage), Graph::NAME, schema::GRAPH, graphMembers, outError)) {
      return std::nullopt;
    }
    return builder;
  }

  bool setMeta(flatdata::View<Meta> meta, flatdata::ResourceStorageError *outError = nullptr) {
    return setResource("meta", meta.bytes(), outError);
  }

  bool setVertices(flatdata::ArrayView<Character> vertices,
                   flatdata::ResourceStorageError *outError = nullptr) {
    return setResource("vertices", vertices.bytes(), outError);
  }
  std::optional<flatdata::ExternalVector<Character>>
  startVertices(flatdata::ResourceStorageError *outError = nullptr) {
    return startVector<Character>("vertices", outError);
  }

  bool setEdges(flatdata::ArrayView<Coappearance> edges,
                flatdata::ResourceStorageError *outError = nullptr) {
    return setResource("edges", edges.bytes(), outError);
  }
  std::optional<flatdata::ExternalVector<Coappearance>>
  startEdges(flatdata::ResourceStorageError *outError = nullptr) {
    return startVector<Coappearance>("edges", outError);
  }

  std::optional<VerticesData> startVerticesData(flatdata::ResourceStorageError *outError = nullptr) {
    return startMultiVector<VerticesData>("vertices_data", outError);
  }

  bool setChapters(flatdata::ArrayView<Chapter> chapters,
                   flatdata::ResourceStorageError *outError = nullptr) {
    return setResource("chapters", chapters.bytes(), outError);
  }
  std::optional<flatdata::ExternalVector<Chapter>>
  startChapters(flatdata::ResourceStorageError *outError = nullptr) {
    return startVector<Chapter>("chapters", outError);
  }

  bool setStrings(std::span<const uint8_t> data,
                  flatdata::ResourceStorageError *outError = nullptr) {
    return setResource("strings", data, outError);
  }

private:
  GraphBuilder() = default;
};

} // namespace coappearances
