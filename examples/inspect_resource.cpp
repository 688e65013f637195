#include <iostream>

#include <flatdata/flatdata.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <storage-dir> <resource>\n";
    return 1;
  }

  auto storage = std::make_shared<flatdata::FileResourceStorage>(argv[1]);
  std::string name = argv[2];

  flatdata::ResourceStorageError error;
  auto schema = storage->readSchema(name, &error);
  if (!schema) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  auto data = storage->read(name, *schema, &error);
  if (!data) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  std::cout << "Resource: " << name << "\n";
  std::cout << "Size: " << data->size() << " bytes\n\n";
  std::cout << *schema << "\n";

  std::string parseError;
  if (auto layouts = flatdata::parseStructLayouts(*schema, &parseError); layouts) {
    for (const auto &layout : *layouts) {
      std::cout << "\nstruct " << layout.name() << " (" << layout.sizeInBytes() << " bytes)\n";
      for (const auto &field : layout.fields()) {
        std::cout << "  " << field.name << ": bits " << field.offset << ".."
                  << field.offset + field.width << (field.isSigned ? " signed" : "") << "\n";
      }
    }
  } else {
    std::cerr << "Cannot derive layouts: " << parseError << "\n";
  }

  return 0;
}
