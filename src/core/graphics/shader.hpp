#pragma once

#include <string>
#include <unordered_map>

#include <glm/glm.hpp>

namespace manor
{

class shader_t
{
public:
  // Throws std::runtime_error when a stage fails to compile or the program fails to link
  shader_t(const std::string &vertex_src, const std::string &fragment_src);
  ~shader_t();

  shader_t(const shader_t &) = delete;
  auto operator=(const shader_t &) -> shader_t & = delete;

  auto bind() const -> void;
  auto unbind() const -> void;
  auto get_renderer_id() const -> unsigned int
  {
    return m_renderer_id;
  }

  auto set_int(const std::string &name, int value) -> void;
  auto set_float(const std::string &name, float value) -> void;
  auto set_mat4(const std::string &name, const glm::mat4 &value) -> void;

private:
  auto compile_shader(unsigned int type, const std::string &source) -> unsigned int;
  auto get_uniform_location(const std::string &name) const -> int;

  unsigned int m_renderer_id = 0;
  mutable std::unordered_map<std::string, int> m_uniform_cache;
};

} // namespace manor
