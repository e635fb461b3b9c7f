#ifndef PDFMATRIX_PORT_H_H
#define PDFMATRIX_PORT_H_H

// CMake 中的 PdfMatrix 目标是静态库，公开定义了 PDFMATRIX_STATIC；
// 构建为动态库时，由库自身的编译单元定义 PDFMATRIX_EXPORTS。
#if defined(PDFMATRIX_STATIC)
#  define PDFMATRIX_PORT
#elif defined(_WIN32)
#  define PDFMATRIX_PORT_EXPORT __declspec(dllexport)
#  define PDFMATRIX_PORT_IMPORT __declspec(dllimport)
#  if defined(PDFMATRIX_EXPORTS)
#    define PDFMATRIX_PORT PDFMATRIX_PORT_EXPORT
#  else
#    define PDFMATRIX_PORT PDFMATRIX_PORT_IMPORT
#  endif
#else
#  define PDFMATRIX_PORT __attribute__((visibility("default")))
#endif

#endif
