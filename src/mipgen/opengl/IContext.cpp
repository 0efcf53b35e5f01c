/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <mipgen/opengl/IContext.h>

#include <mipgen/Format.h>
#include <type_traits>
#include <vector>

namespace mipgen::opengl {
namespace {
const char* GLerrorToString(GLenum error) {
  switch (error) {
  case GL_NO_ERROR:
    return "GL_NO_ERROR";
  case GL_INVALID_ENUM:
    return "GL_INVALID_ENUM";
  case GL_INVALID_VALUE:
    return "GL_INVALID_VALUE";
  case GL_INVALID_OPERATION:
    return "GL_INVALID_OPERATION";
  case GL_INVALID_FRAMEBUFFER_OPERATION:
    return "GL_INVALID_FRAMEBUFFER_OPERATION";
  case GL_OUT_OF_MEMORY:
    return "GL_OUT_OF_MEMORY";
  default:
    return "unknown GL error";
  }
}

Result::Code GLerrorToCode(GLenum error) {
  switch (error) {
  case GL_NO_ERROR:
    return Result::Code::Ok;
  case GL_INVALID_ENUM:
  case GL_INVALID_VALUE:
    return Result::Code::ArgumentInvalid;
  case GL_INVALID_OPERATION:
  case GL_INVALID_FRAMEBUFFER_OPERATION:
    return Result::Code::InvalidOperation;
  default:
    return Result::Code::RuntimeError;
  }
}

// Strings print as text, other pointers as addresses, GLboolean as a number.
template<typename T>
auto traceArg(const T& value) {
  if constexpr (std::is_same_v<T, const GLchar*>) {
    return value != nullptr ? value : "(null)";
  } else if constexpr (std::is_pointer_v<T>) {
    return fmt::ptr(value);
  } else if constexpr (std::is_same_v<T, GLboolean>) {
    return static_cast<unsigned>(value);
  } else {
    return value;
  }
}
} // namespace

IContext::IContext() : deviceFeatureSet_(*this) {
#if MIPGEN_DEBUG
  alwaysCheckError_ = true;
#endif
}

IContext::~IContext() {
  MIPGEN_SOFT_ASSERT(refCount_ == 0, "Context destroyed while %u objects still use it", refCount_);
}

void IContext::initialize(Result* result) {
  deviceFeatureSet_.initialize();
  if (deviceFeatureSet_.getGLVersion().major < 3) {
    Result::setResult(result, Result::Code::Unsupported, "OpenGL ES 3.0 or newer is required");
    return;
  }
  if (deviceFeatureSet_.hasExtension(Extensions::Debug)) {
    pushDebugGroupProc_ =
        reinterpret_cast<PFNPushDebugGroup>(getProcAddress("glPushDebugGroupKHR"));
    popDebugGroupProc_ = reinterpret_cast<PFNPopDebugGroup>(getProcAddress("glPopDebugGroupKHR"));
    objectLabelProc_ = reinterpret_cast<PFNObjectLabel>(getProcAddress("glObjectLabelKHR"));
  }
  Result::setOk(result);
}

template<typename... Args>
void IContext::afterCall(const char* call, [[maybe_unused]] const Args&... args) const {
#if defined(MIPGEN_API_LOG)
  const std::vector<std::string> traced{MIPGEN_FORMAT("{}", traceArg(args))...};
  MIPGEN_LOG_DEBUG("%s(%s)\n", call, MIPGEN_FORMAT("{}", fmt::join(traced, ", ")).c_str());
#endif
  if (alwaysCheckError_) {
    recordError(call);
  }
}

void IContext::recordError(const char* call) const {
  const GLenum error = glGetError();
  if (error == GL_NO_ERROR) {
    return;
  }
  MIPGEN_DEBUG_ABORT("%s failed with %s", call, GLerrorToString(error));
  if (pendingError_ == GL_NO_ERROR) {
    pendingError_ = error;
    pendingCall_ = call;
  }
}

Result IContext::checkForErrors(const char* caller) const {
  recordError(caller);
  if (pendingError_ == GL_NO_ERROR) {
    return Result();
  }
  Result result(GLerrorToCode(pendingError_),
                MIPGEN_FORMAT(
                    "{}: {} failed with {}", caller, pendingCall_, GLerrorToString(pendingError_)));
  pendingError_ = GL_NO_ERROR;
  pendingCall_ = "";
  return result;
}

///--------------------------------------
/// MARK: - GL

void IContext::activeTexture(GLenum texture) {
  glActiveTexture(texture);
  afterCall("glActiveTexture", texture);
}

void IContext::attachShader(GLuint program, GLuint shader) {
  glAttachShader(program, shader);
  afterCall("glAttachShader", program, shader);
}

void IContext::bindFramebuffer(GLenum target, GLuint framebuffer) {
  glBindFramebuffer(target, framebuffer);
  afterCall("glBindFramebuffer", target, framebuffer);
}

void IContext::bindSampler(GLuint unit, GLuint sampler) {
  glBindSampler(unit, sampler);
  afterCall("glBindSampler", unit, sampler);
}

void IContext::bindTexture(GLenum target, GLuint texture) {
  glBindTexture(target, texture);
  afterCall("glBindTexture", target, texture);
}

GLenum IContext::checkFramebufferStatus(GLenum target) {
  const GLenum status = glCheckFramebufferStatus(target);
  afterCall("glCheckFramebufferStatus", target);
  return status;
}

void IContext::clear(GLbitfield mask) {
  glClear(mask);
  afterCall("glClear", mask);
}

void IContext::clearColor(GLfloat red, GLfloat green, GLfloat blue, GLfloat alpha) {
  glClearColor(red, green, blue, alpha);
  afterCall("glClearColor", red, green, blue, alpha);
}

GLenum IContext::clientWaitSync(GLsync sync, GLbitfield flags, GLuint64 timeout) {
  const GLenum status = glClientWaitSync(sync, flags, timeout);
  afterCall("glClientWaitSync", sync, flags, timeout);
  return status;
}

void IContext::colorMask(GLboolean red, GLboolean green, GLboolean blue, GLboolean alpha) {
  glColorMask(red, green, blue, alpha);
  afterCall("glColorMask", red, green, blue, alpha);
}

void IContext::compileShader(GLuint shader) {
  glCompileShader(shader);
  afterCall("glCompileShader", shader);
}

GLuint IContext::createProgram() {
  const GLuint program = glCreateProgram();
  afterCall("glCreateProgram");
  return program;
}

GLuint IContext::createShader(GLenum shaderType) {
  const GLuint shader = glCreateShader(shaderType);
  afterCall("glCreateShader", shaderType);
  return shader;
}

void IContext::deleteFramebuffers(GLsizei n, const GLuint* framebuffers) {
  glDeleteFramebuffers(n, framebuffers);
  afterCall("glDeleteFramebuffers", n, framebuffers);
}

void IContext::deleteProgram(GLuint program) {
  glDeleteProgram(program);
  afterCall("glDeleteProgram", program);
}

void IContext::deleteSamplers(GLsizei n, const GLuint* samplers) {
  glDeleteSamplers(n, samplers);
  afterCall("glDeleteSamplers", n, samplers);
}

void IContext::deleteShader(GLuint shaderId) {
  glDeleteShader(shaderId);
  afterCall("glDeleteShader", shaderId);
}

void IContext::deleteSync(GLsync sync) {
  glDeleteSync(sync);
  afterCall("glDeleteSync", sync);
}

void IContext::deleteTextures(GLsizei n, const GLuint* textures) {
  glDeleteTextures(n, textures);
  afterCall("glDeleteTextures", n, textures);
}

void IContext::detachShader(GLuint program, GLuint shader) {
  glDetachShader(program, shader);
  afterCall("glDetachShader", program, shader);
}

void IContext::disable(GLenum cap) {
  glDisable(cap);
  afterCall("glDisable", cap);
}

void IContext::drawArrays(GLenum mode, GLint first, GLsizei count) {
  glDrawArrays(mode, first, count);
  afterCall("glDrawArrays", mode, first, count);
  ++drawCallCount_;
}

void IContext::drawBuffers(GLsizei n, const GLenum* buffers) {
  glDrawBuffers(n, buffers);
  afterCall("glDrawBuffers", n, buffers);
}

GLsync IContext::fenceSync(GLenum condition, GLbitfield flags) {
  GLsync sync = glFenceSync(condition, flags);
  afterCall("glFenceSync", condition, flags);
  return sync;
}

void IContext::flush() {
  glFlush();
  afterCall("glFlush");
}

void IContext::framebufferTexture2D(GLenum target,
                                    GLenum attachment,
                                    GLenum textarget,
                                    GLuint texture,
                                    GLint level) {
  glFramebufferTexture2D(target, attachment, textarget, texture, level);
  afterCall("glFramebufferTexture2D", target, attachment, textarget, texture, level);
}

void IContext::genFramebuffers(GLsizei n, GLuint* framebuffers) {
  glGenFramebuffers(n, framebuffers);
  afterCall("glGenFramebuffers", n, framebuffers);
}

void IContext::genSamplers(GLsizei n, GLuint* samplers) {
  glGenSamplers(n, samplers);
  afterCall("glGenSamplers", n, samplers);
}

void IContext::genTextures(GLsizei n, GLuint* textures) {
  glGenTextures(n, textures);
  afterCall("glGenTextures", n, textures);
}

void IContext::getActiveUniform(GLuint program,
                                GLuint index,
                                GLsizei bufsize,
                                GLsizei* length,
                                GLint* size,
                                GLenum* type,
                                GLchar* name) const {
  glGetActiveUniform(program, index, bufsize, length, size, type, name);
  afterCall("glGetActiveUniform", program, index, bufsize);
}

void IContext::getIntegerv(GLenum pname, GLint* params) const {
  glGetIntegerv(pname, params);
  afterCall("glGetIntegerv", pname, params);
}

void IContext::getProgramInfoLog(GLuint program,
                                 GLsizei bufsize,
                                 GLsizei* length,
                                 GLchar* infolog) const {
  glGetProgramInfoLog(program, bufsize, length, infolog);
  afterCall("glGetProgramInfoLog", program, bufsize);
}

void IContext::getProgramiv(GLuint program, GLenum pname, GLint* params) const {
  glGetProgramiv(program, pname, params);
  afterCall("glGetProgramiv", program, pname, params);
}

void IContext::getShaderInfoLog(GLuint shader,
                                GLsizei maxLength,
                                GLsizei* length,
                                GLchar* infoLog) const {
  glGetShaderInfoLog(shader, maxLength, length, infoLog);
  afterCall("glGetShaderInfoLog", shader, maxLength);
}

void IContext::getShaderiv(GLuint shader, GLenum pname, GLint* params) const {
  glGetShaderiv(shader, pname, params);
  afterCall("glGetShaderiv", shader, pname, params);
}

const GLubyte* IContext::getString(GLenum name) const {
  const GLubyte* value = glGetString(name);
  afterCall("glGetString", name);
  return value;
}

const GLubyte* IContext::getStringi(GLenum name, GLuint index) const {
  const GLubyte* value = glGetStringi(name, index);
  afterCall("glGetStringi", name, index);
  return value;
}

void IContext::getSynciv(GLsync sync,
                         GLenum pname,
                         GLsizei bufSize,
                         GLsizei* length,
                         GLint* values) const {
  glGetSynciv(sync, pname, bufSize, length, values);
  afterCall("glGetSynciv", sync, pname, bufSize);
}

GLint IContext::getUniformLocation(GLuint program, const GLchar* name) const {
  const GLint location = glGetUniformLocation(program, name);
  afterCall("glGetUniformLocation", program, name);
  return location;
}

void IContext::linkProgram(GLuint program) {
  glLinkProgram(program);
  afterCall("glLinkProgram", program);
}

void IContext::pixelStorei(GLenum pname, GLint param) {
  glPixelStorei(pname, param);
  afterCall("glPixelStorei", pname, param);
}

void IContext::readPixels(GLint x,
                          GLint y,
                          GLsizei width,
                          GLsizei height,
                          GLenum format,
                          GLenum type,
                          GLvoid* pixels) {
  glReadPixels(x, y, width, height, format, type, pixels);
  afterCall("glReadPixels", x, y, width, height, format, type, pixels);
}

void IContext::samplerParameterf(GLuint sampler, GLenum pname, GLfloat param) {
  glSamplerParameterf(sampler, pname, param);
  afterCall("glSamplerParameterf", sampler, pname, param);
}

void IContext::samplerParameteri(GLuint sampler, GLenum pname, GLint param) {
  glSamplerParameteri(sampler, pname, param);
  afterCall("glSamplerParameteri", sampler, pname, param);
}

void IContext::shaderSource(GLuint shader,
                            GLsizei count,
                            const GLchar** string,
                            const GLint* length) {
  glShaderSource(shader, count, string, length);
  afterCall("glShaderSource", shader, count);
}

void IContext::texImage2D(GLenum target,
                          GLint level,
                          GLint internalformat,
                          GLsizei width,
                          GLsizei height,
                          GLint border,
                          GLenum format,
                          GLenum type,
                          const GLvoid* data) {
  glTexImage2D(target, level, internalformat, width, height, border, format, type, data);
  afterCall("glTexImage2D", target, level, internalformat, width, height, format, type, data);
}

void IContext::texParameteri(GLenum target, GLenum pname, GLint param) {
  glTexParameteri(target, pname, param);
  afterCall("glTexParameteri", target, pname, param);
}

void IContext::texStorage2D(GLenum target,
                            GLsizei levels,
                            GLenum internalformat,
                            GLsizei width,
                            GLsizei height) {
  glTexStorage2D(target, levels, internalformat, width, height);
  afterCall("glTexStorage2D", target, levels, internalformat, width, height);
}

void IContext::texSubImage2D(GLenum target,
                             GLint level,
                             GLint xoffset,
                             GLint yoffset,
                             GLsizei width,
                             GLsizei height,
                             GLenum format,
                             GLenum type,
                             const GLvoid* pixels) {
  glTexSubImage2D(target, level, xoffset, yoffset, width, height, format, type, pixels);
  afterCall("glTexSubImage2D", level, xoffset, yoffset, width, height, format, type, pixels);
}

void IContext::uniform1i(GLint location, GLint x) {
  glUniform1i(location, x);
  afterCall("glUniform1i", location, x);
}

void IContext::useProgram(GLuint program) {
  glUseProgram(program);
  afterCall("glUseProgram", program);
}

void IContext::viewport(GLint x, GLint y, GLsizei width, GLsizei height) {
  glViewport(x, y, width, height);
  afterCall("glViewport", x, y, width, height);
}

///--------------------------------------
/// MARK: - KHR_debug

void IContext::pushDebugGroup(const char* message) {
  if (pushDebugGroupProc_ != nullptr) {
    pushDebugGroupProc_(GL_DEBUG_SOURCE_APPLICATION_KHR, 0, -1, message);
    afterCall("glPushDebugGroupKHR", message);
  }
}

void IContext::popDebugGroup() {
  if (popDebugGroupProc_ != nullptr) {
    popDebugGroupProc_();
    afterCall("glPopDebugGroupKHR");
  }
}

void IContext::objectLabel(GLenum identifier, GLuint name, const std::string& label) {
  if (objectLabelProc_ != nullptr && !label.empty()) {
    objectLabelProc_(identifier, name, static_cast<GLsizei>(label.size()), label.c_str());
    afterCall("glObjectLabelKHR", identifier, name, label.c_str());
  }
}

///--------------------------------------
/// MARK: - State

const DeviceFeatureSet& IContext::deviceFeatures() const {
  return deviceFeatureSet_;
}

unsigned int IContext::getCurrentDrawCount() const {
  return drawCallCount_;
}

void IContext::addRef() {
  ++refCount_;
}

bool IContext::releaseRef() {
  if (refCount_ == 0) {
    return false;
  }
  --refCount_;
  return true;
}

} // namespace mipgen::opengl
