#include <cstring>
#include <iostream>

#include "coappearances.hpp"

using namespace coappearances;

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <output-dir>\n";
    return 1;
  }

  auto storage = std::make_shared<flatdata::FileResourceStorage>(argv[1]);
  flatdata::ResourceStorageError error;

  auto builder = GraphBuilder::create(storage, &error);
  if (!builder) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  const char strings[] = "Les Miserables\0Victor Hugo\0Myriel\0Napoleon\0Bishop\0";
  flatdata::StructBuffer<Meta> meta;
  meta.mut().set(Meta::title_ref, 0);
  meta.mut().set(Meta::author_ref, 15);

  bool ok = builder->setMeta(meta.view(), &error) &&
            builder->setStrings({reinterpret_cast<const uint8_t *>(strings), sizeof(strings)},
                                &error);

  if (ok) {
    auto vertices = builder->startVertices(&error);
    ok = vertices.has_value();
    if (ok) {
      vertices->grow().set(Character::name_ref, 27);
      vertices->grow().set(Character::name_ref, 34);
      ok = vertices->close(&error).has_value();
    }
  }

  if (ok) {
    flatdata::Vector<Coappearance> edges;
    auto edge = edges.grow();
    edge.set(Coappearance::a_ref, 0);
    edge.set(Coappearance::b_ref, 1);
    edge.set(Coappearance::count, 1);
    edge.set(Coappearance::first_chapter_ref, 0);

    flatdata::Vector<Chapter> chapters;
    auto chapter = chapters.grow();
    chapter.set(Chapter::major, 1);
    chapter.set(Chapter::minor, 1);

    ok = builder->setEdges(edges.view(), &error) && builder->setChapters(chapters.view(), &error);
  }

  if (ok) {
    auto data = builder->startVerticesData(&error);
    ok = data.has_value();
    if (ok) {
      data->grow().add<Description>().set(Description::ref, 43);
      ok = data->finishItem(&error);
      if (ok) {
        auto relation = data->grow().add<UnaryRelation>();
        relation.set(UnaryRelation::kind_ref, 43);
        relation.set(UnaryRelation::to_ref, 0);
        ok = data->finishItem(&error) && data->close(&error).has_value();
      }
    }
  }

  if (!ok) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  auto graph = Graph::open(storage, &error);
  if (!graph) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  std::cout << graph->describe();
  auto text = graph->strings();
  for (auto vertex : graph->vertices()) {
    const char *name = reinterpret_cast<const char *>(text.data()) +
                       vertex.get(Character::name_ref);
    std::cout << "character: " << name << "\n";
  }
  return 0;
}
