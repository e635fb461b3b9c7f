#ifndef PDFMATRIX_MATH_H_H
#define PDFMATRIX_MATH_H_H

constexpr static double PM_Pi = 3.14159265358979323846;

// IsNearEqual / IsIdentity 的默认容差
constexpr static double PM_Epsilon = 1e-10;

// Rotated 使用的角度转弧度，按 d / 180 * π 的顺序计算
inline double PM_DegreesToRadians(double degrees)
{
	return degrees / 180.0 * PM_Pi;
}

#endif
