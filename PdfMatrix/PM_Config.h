#ifndef PDFMATRIX_CONFIG_H_H
#define PDFMATRIX_CONFIG_H_H

#include "PdfMatrixPort.h"
#include <string>
#include <unordered_map>

// "$XDG_CONFIG_HOME/PdfMatrix/PdfMatrix.conf"；未设置 XDG_CONFIG_HOME 时为 "$HOME/.config/PdfMatrix/PdfMatrix.conf"
PDFMATRIX_PORT std::string GetPmConfigPath();

/**
 * @brief 只读地加载配置文件，日志器启动时用它读取 PM_* 键。
 *
 * 文件格式为每行一个 `key=value`：
 * - 以 '#' 开头的行和空行被忽略；
 * - 键和值两端的空白被去掉，值中可以再出现 '='；
 * - 没有 '=' 或键为空的行被跳过；
 * - 同一个键出现多次时以最后一次为准。
 *
 * @return 文件无法打开时返回 false，values 被清空。
 */
PDFMATRIX_PORT bool LoadPmConfig(const std::string& filePath, std::unordered_map<std::string, std::string>& values);

#endif
