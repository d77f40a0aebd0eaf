#include <kinscene/xml/expression_parser.h>

#include <sstream>
#include <stdexcept>

#include <muParser.h>

namespace kinscene {
namespace xml {

namespace {

constexpr long double kPiL = 3.141592653589793238462643383279502884L;
constexpr long double kTauL = 2.0L * kPiL;

std::string where(const tinyxml2::XMLElement* elem)
{
  return std::string("<") + (elem ? elem->Name() : "?") + "> at line " + std::to_string(elem ? elem->GetLineNum() : 0);
}

void register_math_symbols(mu::Parser& parser)
{
  using Real = mu::value_type;

  parser.DefineConst("pi", static_cast<Real>(kPiL));
  parser.DefineConst("tau", static_cast<Real>(kTauL));
}

mu::Parser& get_math_parser()
{
  // One parser per thread, initialized once
  thread_local mu::Parser parser = [] {
    mu::Parser p;
    register_math_symbols(p);
    return p;
  }();
  return parser;
}

double evalAttributeExpr(const char* expr, const tinyxml2::XMLElement* elem, const char* attr)
{
  try
  {
    return evalNumberExpr(expr);
  }
  catch (const std::runtime_error& e)
  {
    throw std::runtime_error(std::string(e.what()) + " (attribute '" + attr + "' = '" + expr + "' on " +
                             where(elem) + ")");
  }
}

}  // namespace

double evalNumberExpr(const char* expr)
{
  if (!expr)
    throw std::runtime_error("Expression string is null.");

  try
  {
    mu::Parser& parser = get_math_parser();  // reuse per-thread instance
    parser.SetExpr(expr);
    return parser.Eval();
  }
  catch (mu::Parser::exception_type& e)
  {
    throw std::runtime_error(std::string("Error parsing expression: ") + e.GetMsg());
  }
}

double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' on " + where(elem));
  return evalAttributeExpr(expr, elem, attr);
}

double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    return fallback;
  return evalAttributeExpr(expr, elem, attr);
}

std::vector<double> evalNumberListAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* text = elem ? elem->Attribute(attr) : nullptr;
  if (!text)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' on " + where(elem));

  std::vector<double> out;
  std::istringstream ss(text);
  std::string token;
  while (ss >> token)
    out.push_back(evalAttributeExpr(token.c_str(), elem, attr));
  return out;
}

Eigen::Vector3d evalVector3AttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const auto values = evalNumberListAttributeRequired(elem, attr);
  if (values.size() != 3)
    throw std::runtime_error(std::string("Attribute '") + attr + "' expects 3 numbers, got " +
                             std::to_string(values.size()) + " on " + where(elem));
  return Eigen::Vector3d(values[0], values[1], values[2]);
}

Eigen::Vector3d evalVector3Attribute(const tinyxml2::XMLElement* elem, const char* attr,
                                     const Eigen::Vector3d& fallback)
{
  if (!elem || !elem->Attribute(attr))
    return fallback;
  return evalVector3AttributeRequired(elem, attr);
}

std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* text = elem ? elem->Attribute(attr) : nullptr;
  if (!text)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' on " + where(elem));
  return text;
}

std::string evalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, const std::string& fallback)
{
  const char* text = elem ? elem->Attribute(attr) : nullptr;
  return text ? std::string(text) : fallback;
}

}  // namespace xml
}  // namespace kinscene
