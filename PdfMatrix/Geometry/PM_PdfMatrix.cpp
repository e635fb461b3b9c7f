#include "PM_PdfMatrix.h"
#include "PM_Point2d.h"
#include "../PM_Error.h"
#include "../PM_Logger.h"
#include <cmath>
#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace
{
    [[noreturn]] void RejectArguments(const std::string& factoryName, const std::string& argumentsText)
    {
        PMLOG_WARNING(factoryName + " rejected arguments " + argumentsText);
        throw PM_InvalidArgument(argumentsText);
    }
}

PM_PdfMatrix::PM_PdfMatrix()
    : PM_PdfMatrix(1, 0, 0, 1, 0, 0)
{
}

PM_PdfMatrix::PM_PdfMatrix(double a, double b, double c, double d, double e, double f)
{
    m[0][0] = a;
    m[0][1] = b;
    m[0][2] = 0;

    m[1][0] = c;
    m[1][1] = d;
    m[1][2] = 0;

    m[2][0] = e;
    m[2][1] = f;
    m[2][2] = 1;
}

PM_PdfMatrix PM_PdfMatrix::Identity()
{
    return PM_PdfMatrix();
}

PM_PdfMatrix PM_PdfMatrix::CreateFromCoefficients(double a, double b, double c, double d, double e, double f)
{
    return PM_PdfMatrix(a, b, c, d, e, f);
}

PM_PdfMatrix PM_PdfMatrix::CreateFromShorthand(const std::vector<double>& shorthand)
{
    if (shorthand.size() != 6)
    {
        RejectArguments("CreateFromShorthand", PM_FormatArguments(shorthand));
    }
    return PM_PdfMatrix(shorthand[0], shorthand[1], shorthand[2], shorthand[3], shorthand[4], shorthand[5]);
}

PM_PdfMatrix PM_PdfMatrix::CreateFromShorthand(const std::array<double, 6>& shorthand)
{
    return PM_PdfMatrix(shorthand[0], shorthand[1], shorthand[2], shorthand[3], shorthand[4], shorthand[5]);
}

PM_PdfMatrix PM_PdfMatrix::CreateFromGrid(const std::vector<std::vector<double>>& grid)
{
    bool isSquare3 = grid.size() == 3;
    for (size_t rowIndex = 0; isSquare3 && rowIndex < 3; rowIndex++)
    {
        isSquare3 = grid[rowIndex].size() == 3;
    }
    if (!isSquare3)
    {
        RejectArguments("CreateFromGrid", PM_FormatArguments(grid));
    }

    PM_PdfMatrix result;
    for (size_t rowIndex = 0; rowIndex < 3; rowIndex++)
    {
        for (size_t colIndex = 0; colIndex < 3; colIndex++)
        {
            result.m[rowIndex][colIndex] = grid[rowIndex][colIndex];
        }
    }
    return result;
}

PM_PdfMatrix PM_PdfMatrix::CreateFromGrid(const double grid[3][3])
{
    PM_PdfMatrix result;
    for (size_t rowIndex = 0; rowIndex < 3; rowIndex++)
    {
        for (size_t colIndex = 0; colIndex < 3; colIndex++)
        {
            result.m[rowIndex][colIndex] = grid[rowIndex][colIndex];
        }
    }
    return result;
}

PM_PdfMatrix PM_PdfMatrix::CreateFromArguments(const std::vector<double>& arguments)
{
    if (arguments.empty())
    {
        return PM_PdfMatrix();
    }
    if (arguments.size() == 6)
    {
        return CreateFromShorthand(arguments);
    }
    RejectArguments("CreateFromArguments", PM_FormatArguments(arguments));
}

PM_PdfMatrix PM_PdfMatrix::Compose(const PM_PdfMatrix& other) const
{
    // 完整 3×3 乘法：CreateFromGrid 允许非标准第三列，不能省略任何项。
    PM_PdfMatrix result;
    for (size_t rowIndex = 0; rowIndex < 3; rowIndex++)
    {
        for (size_t colIndex = 0; colIndex < 3; colIndex++)
        {
            double sum = 0;
            for (size_t k = 0; k < 3; k++)
            {
                sum += m[rowIndex][k] * other.m[k][colIndex];
            }
            result.m[rowIndex][colIndex] = sum;
        }
    }
    return result;
}

PM_PdfMatrix PM_PdfMatrix::operator*(const PM_PdfMatrix& other) const
{
    return Compose(other);
}

PM_PdfMatrix PM_PdfMatrix::Scaled(double scaleX, double scaleY) const
{
    return Compose(PM_PdfMatrix(scaleX, 0, 0, scaleY, 0, 0));
}

PM_PdfMatrix PM_PdfMatrix::Rotated(double angleDegreesCcw) const
{
    const double angle = PM_DegreesToRadians(angleDegreesCcw);
    const double cosValue = std::cos(angle);
    const double sinValue = std::sin(angle);
    return Compose(PM_PdfMatrix(cosValue, sinValue, -sinValue, cosValue, 0, 0));
}

PM_PdfMatrix PM_PdfMatrix::Translated(double translateX, double translateY) const
{
    return Compose(PM_PdfMatrix(1, 0, 0, 1, translateX, translateY));
}

std::array<double, 6> PM_PdfMatrix::Shorthand() const
{
    return { { A(), B(), C(), D(), E(), F() } };
}

double PM_PdfMatrix::A() const
{
    return m[0][0];
}

double PM_PdfMatrix::B() const
{
    return m[0][1];
}

double PM_PdfMatrix::C() const
{
    return m[1][0];
}

double PM_PdfMatrix::D() const
{
    return m[1][1];
}

double PM_PdfMatrix::E() const
{
    return m[2][0];
}

double PM_PdfMatrix::F() const
{
    return m[2][1];
}

const double (&PM_PdfMatrix::Grid() const)[3][3]
{
    return m;
}

double PM_PdfMatrix::Get(size_t rowIndex, size_t colIndex) const
{
    if (rowIndex >= 3 || colIndex >= 3)
    {
        throw std::out_of_range("PM_PdfMatrix index out of range");
    }
    return m[rowIndex][colIndex];
}

bool PM_PdfMatrix::Equals(const PM_PdfMatrix& other) const
{
    return Shorthand() == other.Shorthand();
}

bool PM_PdfMatrix::operator==(const PM_PdfMatrix& other) const
{
    return Equals(other);
}

bool PM_PdfMatrix::operator!=(const PM_PdfMatrix& other) const
{
    return !Equals(other);
}

bool PM_PdfMatrix::IsNearEqual(const PM_PdfMatrix& other, double tolerance) const
{
    const double absTol = std::abs(tolerance);
    for (size_t rowIndex = 0; rowIndex < 3; rowIndex++)
    {
        for (size_t colIndex = 0; colIndex < 3; colIndex++)
        {
            // NaN 参与比较时返回 false
            if (!(std::abs(m[rowIndex][colIndex] - other.m[rowIndex][colIndex]) <= absTol))
            {
                return false;
            }
        }
    }
    return true;
}

bool PM_PdfMatrix::IsIdentity(double tolerance) const
{
    return IsNearEqual(Identity(), tolerance);
}

bool PM_PdfMatrix::HasAffineColumn() const
{
    return m[0][2] == 0 && m[1][2] == 0 && m[2][2] == 1;
}

PM_Point2d PM_PdfMatrix::TransformPoint(const PM_Point2d& point) const
{
    const double x = point.x * m[0][0] + point.y * m[1][0] + m[2][0];
    const double y = point.x * m[0][1] + point.y * m[1][1] + m[2][1];
    const double w = point.x * m[0][2] + point.y * m[1][2] + m[2][2];
    if (w == 1)
    {
        return PM_Point2d(x, y);
    }
    return PM_Point2d(x / w, y / w);
}

PM_ByteBuffer PM_PdfMatrix::Encode() const
{
    const std::string text = EncodeToString();
    return PM_ByteBuffer(text.begin(), text.end());
}

std::string PM_PdfMatrix::EncodeToString() const
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6);
    const std::array<double, 6> shorthand = Shorthand();
    for (size_t i = 0; i < shorthand.size(); i++)
    {
        if (i > 0)
        {
            oss << ' ';
        }
        // 无效运算得到的 NaN 带符号位，流会输出 "-nan"；统一写成 "nan"
        if (std::isnan(shorthand[i]))
        {
            oss << "nan";
        }
        else
        {
            oss << shorthand[i];
        }
    }
    return oss.str();
}

std::string PM_PdfMatrix::ToDebugString() const
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << "PM_PdfMatrix((" << std::setprecision(17);
    for (size_t rowIndex = 0; rowIndex < 3; rowIndex++)
    {
        if (rowIndex > 0)
        {
            oss << ", ";
        }
        oss << "(" << m[rowIndex][0] << ", " << m[rowIndex][1] << ", " << m[rowIndex][2] << ")";
    }
    oss << "))";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const PM_PdfMatrix& matrix)
{
    return os << matrix.ToDebugString();
}
