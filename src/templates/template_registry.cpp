#include "templates/template_registry.hpp"
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace templates {

//==============================================
// REGISTRATION
//==============================================

void TemplateRegistry::register_renderer(const std::string& name, std::unique_ptr<TemplateRenderer> renderer) {
  BOOST_LOG_TRIVIAL(debug) << "Templates: Registering engine " << name;
  renderers_[name] = std::move(renderer);
}

bool TemplateRegistry::contains(const std::string& name) const {
  return renderers_.count(name) != 0;
}

std::vector<std::string> TemplateRegistry::names() const {
  std::vector<std::string> result;
  for (const auto& entry : renderers_) {
    result.push_back(entry.first);
  }
  return result;
}


//==============================================
// RENDERING
//==============================================

RenderResult TemplateRegistry::render(const std::string& name, const std::filesystem::path& source,
                                      const TemplateParams& params) const {
  auto it = renderers_.find(name);
  if (it == renderers_.end() || !it->second) {
    BOOST_LOG_TRIVIAL(error) << "Templates: Unknown template engine: " << name;
    return RenderResult{false, "Unknown template engine: " + name};
  }

  BOOST_LOG_TRIVIAL(debug) << "Templates: Rendering " << source.string() << " with " << name;
  return it->second->render(source, params);
}

} // namespace templates
} // namespace fileclient
