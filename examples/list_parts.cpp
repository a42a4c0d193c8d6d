#include <iostream>

#include <resqx/resqx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <package.epc>\n";
    return 1;
  }

  // Diagnostics are printed below, once
  resqx::setLogLevel("error");

  resqx::PackageOptions options;
  options.strictLoad = false;

  resqx::LoadReport report;
  resqx::Error error;
  auto model = resqx::Model::load(argv[1], options, &report, &error);

  if (!model) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  const resqx::Package &package = model->package();
  std::cout << "Package: " << argv[1] << "\n";
  std::cout << "Objects: " << report.objectCount << ", arrays: " << report.arrayCount << "\n\n";

  for (const auto &oid : model->objects()) {
    auto document = package.document(oid);
    if (!document) {
      continue;
    }
    std::cout << "  " << *package.partName(oid) << "\n";
    std::cout << "    " << document->type << " \"" << document->citation.title << "\" "
              << oid.str() << "\n";
    for (const auto &[name, handle] : document->arrays) {
      std::cout << "    " << name << ": " << resqx::toString(handle.dtype) << " "
                << resqx::shapeString(handle.shape) << " (" << handle.path << ")\n";
    }
  }

  for (const auto &diagnostic : report.diagnostics) {
    std::cerr << "Warning: " << diagnostic.describe() << "\n";
  }
  return report.clean() ? 0 : 2;
}
