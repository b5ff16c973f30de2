#include "core/graphics/window.hpp"
#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace manor
{

static int s_window_count = 0;

static void glfw_error_callback(int error, const char *description)
{
  std::cerr << "GLFW Error (" << error << "): " << description << std::endl;
}

window_t::window_t(const properties_t &props)
{
  init(props);
}

window_t::~window_t()
{
  shutdown();
}

auto window_t::init(const properties_t &props) -> void
{
  m_data = props;

  if (s_window_count == 0)
  {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit())
      throw std::runtime_error("Could not initialize GLFW!");
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  m_window = glfwCreateWindow(m_data.width, m_data.height, m_data.title.c_str(), nullptr, nullptr);
  if (!m_window)
  {
    if (s_window_count == 0)
      glfwTerminate();
    throw std::runtime_error("Could not create GLFW window!");
  }
  ++s_window_count;

  glfwMakeContextCurrent(m_window);

  if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
  {
    shutdown();
    throw std::runtime_error("Failed to initialize GLAD");
  }

  glfwSetWindowUserPointer(m_window, &m_data);

  // The framebuffer can be larger than the window on high-dpi screens
  int fb_width, fb_height;
  glfwGetFramebufferSize(m_window, &fb_width, &fb_height);
  glViewport(0, 0, fb_width, fb_height);

  glfwSetFramebufferSizeCallback(m_window,
                                 [](GLFWwindow *window, int width, int height)
                                 {
                                   glViewport(0, 0, width, height);
                                 });

  glfwSetKeyCallback(m_window,
                     [](GLFWwindow *window, int key, int scancode, int action, int mods)
                     {
                       if (action != GLFW_PRESS)
                         return;
                       auto *props = (window_t::properties_t *)glfwGetWindowUserPointer(window);
                       if (!props || !props->key_callback)
                         return;
                       std::string name = window_t::key_name(key, scancode);
                       if (!name.empty())
                         props->key_callback(name);
                     });

  glfwSwapInterval(m_data.vsync ? 1 : 0);
}

auto window_t::key_name(int key, int scancode) -> std::string
{
  switch (key)
  {
  case GLFW_KEY_UP:
    return "UP";
  case GLFW_KEY_DOWN:
    return "DOWN";
  case GLFW_KEY_LEFT:
    return "LEFT";
  case GLFW_KEY_RIGHT:
    return "RIGHT";
  case GLFW_KEY_ENTER:
  case GLFW_KEY_KP_ENTER:
    return "ENTER";
  case GLFW_KEY_SPACE:
    return "SPACE";
  case GLFW_KEY_ESCAPE:
    return "ESCAPE";
  case GLFW_KEY_TAB:
    return "TAB";
  case GLFW_KEY_BACKSPACE:
    return "BACKSPACE";
  default:
    break;
  }

  // Printable keys: ask GLFW what the current layout prints, so that the key
  // labelled Z on an AZERTY board reports "Z"
  const char *printable = glfwGetKeyName(key, scancode);
  if (!printable || !printable[0] || printable[1])
    return "";
  return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(printable[0]))));
}

auto window_t::shutdown() -> void
{
  if (m_window)
  {
    glfwDestroyWindow(m_window);
    m_window = nullptr;
    if (--s_window_count == 0)
      glfwTerminate();
  }
}

auto window_t::should_close() const -> bool
{
  return glfwWindowShouldClose(m_window);
}

auto window_t::close() -> void
{
  glfwSetWindowShouldClose(m_window, GLFW_TRUE);
}

auto window_t::update() -> void
{
  glfwPollEvents();
}

auto window_t::swap_buffers() -> void
{
  glfwSwapBuffers(m_window);
}

auto window_t::get_time() const -> double
{
  return glfwGetTime();
}

} // namespace manor
