#ifndef PDFMATRIX_PDF_MATRIX_H_H
#define PDFMATRIX_PDF_MATRIX_H_H

#include "../PdfMatrixPort.h"
#include "../PM_BaseTypes.h"
#include "../PM_Math.h"
#include <array>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

class PM_Point2d;

/*
 * @brief PDF 内容流矩阵：3×3 双精度齐次矩阵，以简写 (a, b, c, d, e, f) 表示。
 *
 * ## 约定（重要）
 *   - 行向量约定：点 (x, y, 1) 经矩阵 M 变换为 (x, y, 1) · M。
 *   - 简写位置：a = m[0][0], b = m[0][1], c = m[1][0], d = m[1][1], e = m[2][0], f = m[2][1]。
 *     e、f 通常为 x/y 平移。
 *   - 第三列固定为 (0, 0, 1)。唯一例外是 CreateFromGrid：逐元素原样拷贝，不做校验。
 *
 * 对象不可变，所有变换都返回新矩阵。
 */
class PDFMATRIX_PORT PM_PdfMatrix
{
public:
	// 单位矩阵。
	PM_PdfMatrix();

	// 由简写 (a, b, c, d, e, f) 构造，第三列为 (0, 0, 1)。
	PM_PdfMatrix(double a, double b, double c, double d, double e, double f);

	static PM_PdfMatrix Identity();

	static PM_PdfMatrix CreateFromCoefficients(double a, double b, double c, double d, double e, double f);

	// 由长度为 6 的简写序列构造；长度不为 6 时抛出 PM_InvalidArgument。
	static PM_PdfMatrix CreateFromShorthand(const std::vector<double>& shorthand);
	static PM_PdfMatrix CreateFromShorthand(const std::array<double, 6>& shorthand);

	// 由 3×3 嵌套序列逐行原样拷贝，不校验第三列；形状不是 3×3 时抛出 PM_InvalidArgument。
	static PM_PdfMatrix CreateFromGrid(const std::vector<std::vector<double>>& grid);
	static PM_PdfMatrix CreateFromGrid(const double grid[3][3]);

	// 按参数个数分派：0 个为单位矩阵，6 个为简写，其余抛出 PM_InvalidArgument。
	static PM_PdfMatrix CreateFromArguments(const std::vector<double>& arguments);

	// 矩阵乘法 this · other：先应用 this，再应用 other。
	PM_PdfMatrix Compose(const PM_PdfMatrix& other) const;
	PM_PdfMatrix operator*(const PM_PdfMatrix& other) const;

	// 右乘缩放矩阵 (x, 0, 0, y, 0, 0)。
	PM_PdfMatrix Scaled(double scaleX, double scaleY) const;

	// 右乘旋转矩阵（角度制，逆时针为正）。
	PM_PdfMatrix Rotated(double angleDegreesCcw) const;

	// 右乘平移矩阵 (1, 0, 0, 1, x, y)。
	PM_PdfMatrix Translated(double translateX, double translateY) const;

	std::array<double, 6> Shorthand() const;

	double A() const;
	double B() const;
	double C() const;
	double D() const;

	// 通常对应 x 方向平移。
	double E() const;

	// 通常对应 y 方向平移。
	double F() const;

	// 只读访问完整 3×3 网格。
	const double (&Grid() const)[3][3];

	// 越界时抛出 std::out_of_range。
	double Get(size_t rowIndex, size_t colIndex) const;

	// 简写逐元素精确比较（不带容差）。
	bool Equals(const PM_PdfMatrix& other) const;
	bool operator==(const PM_PdfMatrix& other) const;
	bool operator!=(const PM_PdfMatrix& other) const;

	// 完整 3×3 网格逐元素容差比较。
	bool IsNearEqual(const PM_PdfMatrix& other, double tolerance = PM_Epsilon) const;

	bool IsIdentity(double tolerance = PM_Epsilon) const;

	// 第三列是否精确为 (0, 0, 1)。
	bool HasAffineColumn() const;

	// 行向量约定下变换点：(x, y, 1) · M；第三列非 (0, 0, 1) 时按齐次分量归一化。
	PM_Point2d TransformPoint(const PM_Point2d& point) const;

	// "%.6f %.6f %.6f %.6f %.6f %.6f"，按 a b c d e f 顺序，ASCII，无首尾空白。
	PM_ByteBuffer Encode() const;
	std::string EncodeToString() const;

	// 调试用，输出完整网格，不可解析。
	std::string ToDebugString() const;

private:
	double m[3][3];
};

PDFMATRIX_PORT std::ostream& operator<<(std::ostream& os, const PM_PdfMatrix& matrix);






#endif
