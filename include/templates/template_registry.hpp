#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fileclient {
namespace templates {

using TemplateParams = std::map<std::string, std::string>;

// Outcome of one render. On success data holds the path of the rendered
// temporary file, otherwise an error message.
struct RenderResult {
  bool result = false;
  std::string data;
};

// A templating engine. Engines are plugged in by the embedding application.
class TemplateRenderer {
public:
  virtual ~TemplateRenderer() = default;
  virtual RenderResult render(const std::filesystem::path& source, const TemplateParams& params) = 0;
};

class TemplateRegistry {
public:

  // ---- REGISTRATION ----
  // Replaces any engine already registered under name
  void register_renderer(const std::string& name, std::unique_ptr<TemplateRenderer> renderer);
  bool contains(const std::string& name) const;
  std::vector<std::string> names() const;


  // ---- RENDERING ----
  // Fails with a RenderResult, not an exception, when the engine is unknown
  RenderResult render(const std::string& name, const std::filesystem::path& source,
                      const TemplateParams& params) const;

private:
  std::map<std::string, std::unique_ptr<TemplateRenderer>> renderers_;
};

} // namespace templates
} // namespace fileclient
