/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/egl/Context.h>

#include <array>
#include <string>

#define CHECK_EGL_ERRORS() error_checking::checkForEGLErrors(__FILE__, __FUNCTION__, __LINE__)

#ifndef EGL_OPENGL_ES3_BIT
#define EGL_OPENGL_ES3_BIT 0x00000040
#endif

namespace error_checking {

#define CASE_ERROR_CODE_IMPL(egl_error_code) \
  case egl_error_code:                       \
    errorStr = #egl_error_code;              \
    break;

const char* eglErrorToString(EGLint errorCode) {
  const char* errorStr = nullptr;
  switch (errorCode) {
    // https://www.khronos.org/files/egl-1-4-quick-reference-card.pdf
    CASE_ERROR_CODE_IMPL(EGL_SUCCESS);
    CASE_ERROR_CODE_IMPL(EGL_NOT_INITIALIZED);
    CASE_ERROR_CODE_IMPL(EGL_BAD_ACCESS);
    CASE_ERROR_CODE_IMPL(EGL_BAD_ALLOC);
    CASE_ERROR_CODE_IMPL(EGL_BAD_ATTRIBUTE);
    CASE_ERROR_CODE_IMPL(EGL_BAD_CONFIG);
    CASE_ERROR_CODE_IMPL(EGL_BAD_CONTEXT);
    CASE_ERROR_CODE_IMPL(EGL_BAD_CURRENT_SURFACE);
    CASE_ERROR_CODE_IMPL(EGL_BAD_DISPLAY);
    CASE_ERROR_CODE_IMPL(EGL_BAD_MATCH);
    CASE_ERROR_CODE_IMPL(EGL_BAD_NATIVE_PIXMAP);
    CASE_ERROR_CODE_IMPL(EGL_BAD_NATIVE_WINDOW);
    CASE_ERROR_CODE_IMPL(EGL_BAD_PARAMETER);
    CASE_ERROR_CODE_IMPL(EGL_BAD_SURFACE);
    CASE_ERROR_CODE_IMPL(EGL_CONTEXT_LOST);
  default:
    errorStr = "<unknown EGL error>";
    break;
  }
  return errorStr;
}

EGLint checkForEGLErrors([[maybe_unused]] const char* fileName,
                         [[maybe_unused]] const char* callerName,
                         [[maybe_unused]] size_t lineNum) {
  const EGLint errorCode = eglGetError();
  if (errorCode != EGL_SUCCESS) {
    MIPGEN_LOG_ERROR("EGL error [%s:%zu] in function: %s 0x%04X: %s\n",
                     fileName,
                     lineNum,
                     callerName,
                     errorCode,
                     eglErrorToString(errorCode));
  }
  return errorCode;
}

} // namespace error_checking

namespace mipgen::opengl::egl {

namespace {

Result eglResult(EGLint errorCode, const char* what) {
  if (errorCode == EGL_SUCCESS) {
    return Result();
  }
  return Result(Result::Code::RuntimeError,
                std::string(what) + " failed: " + error_checking::eglErrorToString(errorCode));
}

// 8-bit RGBA; window surfaces are optional so headless displays still find a config
constexpr std::array attribsWindowAndPbuffer{EGLint{EGL_RED_SIZE},
                                             EGLint{8},
                                             EGLint{EGL_GREEN_SIZE},
                                             EGLint{8},
                                             EGLint{EGL_BLUE_SIZE},
                                             EGLint{8},
                                             EGLint{EGL_ALPHA_SIZE},
                                             EGLint{8},
                                             EGLint{EGL_SURFACE_TYPE},
                                             EGLint{EGL_PBUFFER_BIT | EGL_WINDOW_BIT},
                                             EGLint{EGL_RENDERABLE_TYPE},
                                             EGLint{EGL_OPENGL_ES3_BIT},
                                             EGLint{EGL_NONE}};
constexpr std::array attribsPbuffer{EGLint{EGL_RED_SIZE},
                                    EGLint{8},
                                    EGLint{EGL_GREEN_SIZE},
                                    EGLint{8},
                                    EGLint{EGL_BLUE_SIZE},
                                    EGLint{8},
                                    EGLint{EGL_ALPHA_SIZE},
                                    EGLint{8},
                                    EGLint{EGL_SURFACE_TYPE},
                                    EGLint{EGL_PBUFFER_BIT},
                                    EGLint{EGL_RENDERABLE_TYPE},
                                    EGLint{EGL_OPENGL_ES3_BIT},
                                    EGLint{EGL_NONE}};
constexpr std::array contextAttribsOpenGLES3{EGLint{EGL_CONTEXT_CLIENT_VERSION},
                                             EGLint{3},
                                             EGLint{EGL_NONE}};

EGLConfig chooseConfig(EGLDisplay display) {
  EGLConfig config{nullptr};
  EGLint numConfigs{0};
  if (eglChooseConfig(display, attribsWindowAndPbuffer.data(), &config, 1, &numConfigs) &&
      numConfigs > 0) {
    return config;
  }
  if (eglChooseConfig(display, attribsPbuffer.data(), &config, 1, &numConfigs) &&
      numConfigs > 0) {
    return config;
  }
  CHECK_EGL_ERRORS();
  return nullptr;
}

} // namespace

///--------------------------------------
/// MARK: - Context

std::unique_ptr<Context> Context::createOffscreen(size_t width,
                                                  size_t height,
                                                  Result* outResult) {
  EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
  if (display == EGL_NO_DISPLAY) {
    Result::setResult(outResult, Result::Code::RuntimeError, "No default EGL display");
    return nullptr;
  }
  if (!eglInitialize(display, nullptr, nullptr)) {
    Result::setResult(outResult, eglResult(CHECK_EGL_ERRORS(), "eglInitialize"));
    return nullptr;
  }
  if (!eglBindAPI(EGL_OPENGL_ES_API)) {
    Result::setResult(outResult, eglResult(CHECK_EGL_ERRORS(), "eglBindAPI"));
    return nullptr;
  }

  EGLConfig config = chooseConfig(display);
  if (config == nullptr) {
    Result::setResult(outResult, Result::Code::Unsupported, "No EGL config for OpenGL ES 3");
    return nullptr;
  }

  EGLContext context =
      eglCreateContext(display, config, EGL_NO_CONTEXT, contextAttribsOpenGLES3.data());
  if (context == EGL_NO_CONTEXT) {
    Result::setResult(outResult, eglResult(CHECK_EGL_ERRORS(), "eglCreateContext"));
    return nullptr;
  }

  const std::array pbufferAttribs{EGLint{EGL_WIDTH},
                                  static_cast<EGLint>(width),
                                  EGLint{EGL_HEIGHT},
                                  static_cast<EGLint>(height),
                                  EGLint{EGL_NONE}};
  EGLSurface pbuffer = eglCreatePbufferSurface(display, config, pbufferAttribs.data());
  if (pbuffer == EGL_NO_SURFACE) {
    const auto result = eglResult(CHECK_EGL_ERRORS(), "eglCreatePbufferSurface");
    eglDestroyContext(display, context);
    Result::setResult(outResult, result);
    return nullptr;
  }

  auto ctx = std::unique_ptr<Context>(new Context(display, config, context, pbuffer));
  ctx->setCurrent();
  Result result;
  ctx->initialize(&result);
  if (!result.isOk()) {
    Result::setResult(outResult, std::move(result));
    return nullptr;
  }
  Result::setOk(outResult);
  return ctx;
}

Context::Context(EGLDisplay display, EGLConfig config, EGLContext context, EGLSurface pbuffer) :
  display_(display),
  config_(config),
  context_(context),
  pbufferSurface_(pbuffer),
  drawSurface_(pbuffer) {
  EGLint surfaceType = 0;
  eglGetConfigAttrib(display_, config_, EGL_SURFACE_TYPE, &surfaceType);
  supportsPremultiplied_ = (surfaceType & EGL_VG_ALPHA_FORMAT_PRE_BIT) != 0;
}

Context::~Context() {
  if (isCurrentContext()) {
    clearCurrentContext();
  }
  if (pbufferSurface_ != EGL_NO_SURFACE) {
    eglDestroySurface(display_, pbufferSurface_);
    CHECK_EGL_ERRORS();
  }
  if (context_ != EGL_NO_CONTEXT) {
    eglDestroyContext(display_, context_);
    CHECK_EGL_ERRORS();
  }
}

void Context::setCurrent() {
  eglMakeCurrent(display_, drawSurface_, drawSurface_, context_);
  CHECK_EGL_ERRORS();
}

void Context::clearCurrentContext() const {
  eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
  CHECK_EGL_ERRORS();
}

bool Context::isCurrentContext() const {
  return eglGetCurrentContext() == context_;
}

void Context::present() const {
  const auto result = swapBuffers(drawSurface_);
  if (!result.isOk()) {
    MIPGEN_LOG_ERROR("%s\n", result.message.c_str());
  }
}

bool Context::supportsPremultipliedSurfaces() const {
  return supportsPremultiplied_;
}

EGLSurface Context::createWindowSurface(EGLNativeWindowType window,
                                        bool premultiplied,
                                        Result* outResult) {
  EGLint surfaceType = 0;
  eglGetConfigAttrib(display_, config_, EGL_SURFACE_TYPE, &surfaceType);
  if ((surfaceType & EGL_WINDOW_BIT) == 0) {
    Result::setResult(
        outResult, Result::Code::Unsupported, "The EGL config cannot create window surfaces");
    return EGL_NO_SURFACE;
  }

  const std::array premultipliedAttribs{
      EGLint{EGL_VG_ALPHA_FORMAT}, EGLint{EGL_VG_ALPHA_FORMAT_PRE}, EGLint{EGL_NONE}};
  const EGLint* attribs =
      premultiplied && supportsPremultiplied_ ? premultipliedAttribs.data() : nullptr;

  EGLSurface surface = eglCreateWindowSurface(display_, config_, window, attribs);
  if (surface == EGL_NO_SURFACE) {
    Result::setResult(outResult, eglResult(CHECK_EGL_ERRORS(), "eglCreateWindowSurface"));
    return EGL_NO_SURFACE;
  }
  Result::setOk(outResult);
  return surface;
}

void Context::destroyWindowSurface(EGLSurface surface) {
  if (surface == EGL_NO_SURFACE) {
    return;
  }
  if (drawSurface_ == surface) {
    const auto result = setDrawSurface(EGL_NO_SURFACE);
    if (!result.isOk()) {
      MIPGEN_LOG_ERROR("%s\n", result.message.c_str());
    }
  }
  eglDestroySurface(display_, surface);
  CHECK_EGL_ERRORS();
}

Result Context::setDrawSurface(EGLSurface surface) {
  EGLSurface newSurface = surface == EGL_NO_SURFACE ? pbufferSurface_ : surface;
  if (!eglMakeCurrent(display_, newSurface, newSurface, context_)) {
    return eglResult(CHECK_EGL_ERRORS(), "eglMakeCurrent");
  }
  drawSurface_ = newSurface;
  return Result();
}

Result Context::swapBuffers(EGLSurface surface) const {
  // no effect on the pbuffer
  if (!eglSwapBuffers(display_, surface)) {
    return eglResult(CHECK_EGL_ERRORS(), "eglSwapBuffers");
  }
  return Result();
}

EGLContext Context::get() const {
  return context_;
}

EGLDisplay Context::getDisplay() const {
  return display_;
}

EGLConfig Context::getConfig() const {
  return config_;
}

IContext::GLProc Context::getProcAddress(const char* name) const {
  return reinterpret_cast<GLProc>(eglGetProcAddress(name));
}

} // namespace mipgen::opengl::egl
