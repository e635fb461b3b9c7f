#ifndef PDFMATRIX_BASE_TYPES_H_H
#define PDFMATRIX_BASE_TYPES_H_H

#include <vector>

// 编码后的字节序列（内容流中的 ASCII 文本）
using PM_ByteBuffer = std::vector<unsigned char>;


#endif
