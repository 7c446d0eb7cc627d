// src/common/template_renderer.cpp
#include "agentflow/common/template_renderer.h"
#include <mutex>
#include <stdexcept>

namespace agentflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Prompts are rendered from chain content; never touch the filesystem
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const nlohmann::json& data) {
    // 共享实例，渲染在多个 worker 间串行化
    static InjaTemplateRenderer renderer;
    static std::mutex render_mutex;
    std::lock_guard<std::mutex> lock(render_mutex);
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const nlohmann::json& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentflow
