#ifndef PDFMATRIX_POINT2D_H_H
#define PDFMATRIX_POINT2D_H_H

#include "../PdfMatrixPort.h"
#include "../PM_Math.h"

class PM_PdfMatrix;

class PDFMATRIX_PORT PM_Point2d
{
public:
	double x = 0;
	double y = 0;

	// 原点 (0, 0)
	PM_Point2d();
	PM_Point2d(double x, double y);

	void Set(double x, double y);

	bool operator==(const PM_Point2d& other) const;
	bool operator!=(const PM_Point2d& other) const;

	bool IsNearEqual(const PM_Point2d& other, double tolerance = PM_Epsilon) const;

	// 矩阵变换（行向量约定，包含平移）。
	PM_Point2d Transformed(const PM_PdfMatrix& mat) const;
};



#endif
