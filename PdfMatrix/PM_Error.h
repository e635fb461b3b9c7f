#ifndef PDFMATRIX_ERROR_H_H
#define PDFMATRIX_ERROR_H_H

#include "PdfMatrixPort.h"
#include <stdexcept>
#include <string>
#include <vector>

/*
 * @brief 构造参数形状不合法时抛出的异常。
 *
 * what() 形如 "invalid arguments: [1, 2, 3, 4]"，GetArguments() 仅返回方括号部分，
 * 便于日志与断言直接比对。
 */
class PDFMATRIX_PORT PM_InvalidArgument : public std::invalid_argument
{
public:
	explicit PM_InvalidArgument(const std::string& argumentsText);

	// 出错参数的文本形式。
	const std::string& GetArguments() const;

private:
	std::string arguments;
};

// 把一维/二维参数列表格式化为 "[1, 2, 3]" / "[[1, 0], [0, 1]]"（17 位有效数字，"C" locale）。
PDFMATRIX_PORT std::string PM_FormatArguments(const std::vector<double>& values);
PDFMATRIX_PORT std::string PM_FormatArguments(const std::vector<std::vector<double>>& rows);



#endif
