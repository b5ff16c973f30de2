#pragma once

#include <string>
#include <functional>

// Forward declaration to avoid including GLFW in the header
struct GLFWwindow;

namespace manor
{

class window_t
{
public:
  // Key name as printed on the keycap for the active layout ("Z", "Q"), or a
  // fixed name for non-printable keys ("UP", "ENTER", "ESCAPE")
  using key_callback_t = std::function<void(const std::string &key_name)>;

  struct properties_t
  {
    std::string title;
    int width;
    int height;
    bool vsync;
    key_callback_t key_callback;
  };

  // Throws std::runtime_error when no window or GL context can be created
  window_t(const properties_t &props);
  ~window_t();

  window_t(const window_t &) = delete;
  auto operator=(const window_t &) -> window_t & = delete;

  auto should_close() const -> bool;
  auto close() -> void;
  auto update() -> void;
  auto swap_buffers() -> void;
  auto get_time() const -> double;

  auto get_native_window() const -> GLFWwindow *
  {
    return m_window;
  }
  auto get_width() const -> int
  {
    return m_data.width;
  }
  auto get_height() const -> int
  {
    return m_data.height;
  }

  auto set_key_callback(const key_callback_t &callback) -> void
  {
    m_data.key_callback = callback;
  }

  // GLFW key + scancode -> key name, empty for keys we have no name for
  static auto key_name(int key, int scancode) -> std::string;

private:
  auto init(const properties_t &props) -> void;
  auto shutdown() -> void;

  GLFWwindow *m_window{nullptr};
  properties_t m_data;
};

} // namespace manor
