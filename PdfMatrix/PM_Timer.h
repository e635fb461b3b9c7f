#ifndef PDFMATRIX_TIMER_H_H
#define PDFMATRIX_TIMER_H_H

#include "PdfMatrixPort.h"
#include <string>

/**
 * @brief 获取当前本地时间，格式为 `YYYY-MM-DDTHH:MM:SS[.mmm]`，用作日志时间戳。
 *
 * @param withMs 是否输出 3 位毫秒，默认 true。
 *
 * @par 示例
 * @code
 * std::string s1 = GetLocalTimeStr();       // "2026-10-19T11:44:44.063"
 * std::string s2 = GetLocalTimeStr(false);  // "2026-10-19T11:44:44"
 * @endcode
 *
 * 仅支持 POSIX（localtime_r）。
 */
PDFMATRIX_PORT std::string GetLocalTimeStr(bool withMs = true);










#endif
