#include "PM_Point2d.h"
#include "PM_PdfMatrix.h"
#include <cmath>

PM_Point2d::PM_Point2d()
{
}

PM_Point2d::PM_Point2d(double x, double y) : x(x), y(y)
{
}

void PM_Point2d::Set(double x, double y)
{
	this->x = x;
	this->y = y;
}

bool PM_Point2d::operator==(const PM_Point2d& other) const
{
	return x == other.x && y == other.y;
}

bool PM_Point2d::operator!=(const PM_Point2d& other) const
{
	return !(*this == other);
}

bool PM_Point2d::IsNearEqual(const PM_Point2d& other, double tolerance) const
{
	const double absTol = std::abs(tolerance);
	return std::abs(x - other.x) <= absTol && std::abs(y - other.y) <= absTol;
}

PM_Point2d PM_Point2d::Transformed(const PM_PdfMatrix& mat) const
{
	return mat.TransformPoint(*this);
}
