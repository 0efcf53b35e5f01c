/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mipgen/Common.h>
#include <mipgen/opengl/DeviceFeatureSet.h>
#include <mipgen/opengl/GLIncludes.h>
#include <string>

namespace mipgen::opengl {

/**
 * @brief Thin wrapper over a GL ES 3 context. Every GL entry point the backend uses goes through
 * here so calls can be traced and errors checked in one place. Window-system specifics (making
 * current, swapping, loading extension entry points) are left to subclasses.
 */
class IContext {
 public:
  IContext();
  virtual ~IContext();

  ///--------------------------------------
  /// MARK: - Window system

  virtual void setCurrent() = 0;
  virtual void clearCurrentContext() const = 0;
  [[nodiscard]] virtual bool isCurrentContext() const = 0;
  /** @brief Presents the current draw surface. */
  virtual void present() const = 0;
  /** @brief True when window surfaces can be created with premultiplied alpha. */
  [[nodiscard]] virtual bool supportsPremultipliedSurfaces() const = 0;

  ///--------------------------------------
  /// MARK: - GL

  void activeTexture(GLenum texture);
  void attachShader(GLuint program, GLuint shader);
  void bindFramebuffer(GLenum target, GLuint framebuffer);
  void bindSampler(GLuint unit, GLuint sampler);
  void bindTexture(GLenum target, GLuint texture);
  GLenum checkFramebufferStatus(GLenum target);
  void clear(GLbitfield mask);
  void clearColor(GLfloat red, GLfloat green, GLfloat blue, GLfloat alpha);
  GLenum clientWaitSync(GLsync sync, GLbitfield flags, GLuint64 timeout);
  void colorMask(GLboolean red, GLboolean green, GLboolean blue, GLboolean alpha);
  void compileShader(GLuint shader);
  GLuint createProgram();
  GLuint createShader(GLenum shaderType);
  void deleteFramebuffers(GLsizei n, const GLuint* framebuffers);
  void deleteProgram(GLuint program);
  void deleteSamplers(GLsizei n, const GLuint* samplers);
  void deleteShader(GLuint shaderId);
  void deleteSync(GLsync sync);
  void deleteTextures(GLsizei n, const GLuint* textures);
  void detachShader(GLuint program, GLuint shader);
  void disable(GLenum cap);
  void drawArrays(GLenum mode, GLint first, GLsizei count);
  void drawBuffers(GLsizei n, const GLenum* buffers);
  GLsync fenceSync(GLenum condition, GLbitfield flags);
  void flush();
  void framebufferTexture2D(GLenum target,
                            GLenum attachment,
                            GLenum textarget,
                            GLuint texture,
                            GLint level);
  void genFramebuffers(GLsizei n, GLuint* framebuffers);
  void genSamplers(GLsizei n, GLuint* samplers);
  void genTextures(GLsizei n, GLuint* textures);
  void getActiveUniform(GLuint program,
                        GLuint index,
                        GLsizei bufsize,
                        GLsizei* length,
                        GLint* size,
                        GLenum* type,
                        GLchar* name) const;
  void getIntegerv(GLenum pname, GLint* params) const;
  void getProgramInfoLog(GLuint program, GLsizei bufsize, GLsizei* length, GLchar* infolog) const;
  void getProgramiv(GLuint program, GLenum pname, GLint* params) const;
  void getShaderInfoLog(GLuint shader, GLsizei maxLength, GLsizei* length, GLchar* infoLog) const;
  void getShaderiv(GLuint shader, GLenum pname, GLint* params) const;
  [[nodiscard]] const GLubyte* getString(GLenum name) const;
  [[nodiscard]] const GLubyte* getStringi(GLenum name, GLuint index) const;
  void getSynciv(GLsync sync, GLenum pname, GLsizei bufSize, GLsizei* length, GLint* values) const;
  [[nodiscard]] GLint getUniformLocation(GLuint program, const GLchar* name) const;
  void linkProgram(GLuint program);
  void pixelStorei(GLenum pname, GLint param);
  void readPixels(GLint x,
                  GLint y,
                  GLsizei width,
                  GLsizei height,
                  GLenum format,
                  GLenum type,
                  GLvoid* pixels);
  void samplerParameterf(GLuint sampler, GLenum pname, GLfloat param);
  void samplerParameteri(GLuint sampler, GLenum pname, GLint param);
  void shaderSource(GLuint shader, GLsizei count, const GLchar** string, const GLint* length);
  void texImage2D(GLenum target,
                  GLint level,
                  GLint internalformat,
                  GLsizei width,
                  GLsizei height,
                  GLint border,
                  GLenum format,
                  GLenum type,
                  const GLvoid* data);
  void texParameteri(GLenum target, GLenum pname, GLint param);
  void texStorage2D(GLenum target,
                    GLsizei levels,
                    GLenum internalformat,
                    GLsizei width,
                    GLsizei height);
  void texSubImage2D(GLenum target,
                     GLint level,
                     GLint xoffset,
                     GLint yoffset,
                     GLsizei width,
                     GLsizei height,
                     GLenum format,
                     GLenum type,
                     const GLvoid* pixels);
  void uniform1i(GLint location, GLint x);
  void useProgram(GLuint program);
  void viewport(GLint x, GLint y, GLsizei width, GLsizei height);

  ///--------------------------------------
  /// MARK: - KHR_debug (no-ops when the extension is missing)

  void pushDebugGroup(const char* MIPGEN_NONNULL message);
  void popDebugGroup();
  void objectLabel(GLenum identifier, GLuint name, const std::string& label);

  ///--------------------------------------
  /// MARK: - State

  /**
   * @brief Returns the first GL error raised since the previous check, then clears it. In debug
   * builds every wrapped call is checked as it happens, so the failing call is named in the
   * message; otherwise only glGetError() at this point is seen.
   */
  [[nodiscard]] Result checkForErrors(const char* MIPGEN_NONNULL caller) const;

  [[nodiscard]] const DeviceFeatureSet& deviceFeatures() const;

  [[nodiscard]] unsigned int getCurrentDrawCount() const;

  // Reference counting of objects created with this context (see WithContext)
  void addRef();
  [[nodiscard]] bool releaseRef();

 protected:
  /**
   * @brief Must be called by subclasses once the context is current. Loads extension entry points
   * and reads the feature set.
   */
  void initialize(Result* MIPGEN_NULLABLE result = nullptr);

  using GLProc = void (*)();
  [[nodiscard]] virtual GLProc getProcAddress(const char* MIPGEN_NONNULL name) const = 0;

 private:
  using PFNPushDebugGroup = void (*)(GLenum, GLuint, GLsizei, const GLchar*);
  using PFNPopDebugGroup = void (*)();
  using PFNObjectLabel = void (*)(GLenum, GLuint, GLsizei, const GLchar*);

  DeviceFeatureSet deviceFeatureSet_;

  PFNPushDebugGroup pushDebugGroupProc_ = nullptr;
  PFNPopDebugGroup popDebugGroupProc_ = nullptr;
  PFNObjectLabel objectLabelProc_ = nullptr;

  // Logs the call when MIPGEN_API_LOG is defined; checks glGetError() when alwaysCheckError_.
  template<typename... Args>
  void afterCall(const char* MIPGEN_NONNULL call, const Args&... args) const;
  void recordError(const char* MIPGEN_NONNULL call) const;

  mutable GLenum pendingError_ = GL_NO_ERROR;
  mutable const char* MIPGEN_NONNULL pendingCall_ = "";
  bool alwaysCheckError_ = false;
  unsigned int drawCallCount_ = 0;
  unsigned int refCount_ = 0;
};

} // namespace mipgen::opengl
