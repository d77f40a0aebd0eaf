#ifndef KINSCENE_XML_EXPRESSION_PARSER_H_
#define KINSCENE_XML_EXPRESSION_PARSER_H_

#include <tinyxml2.h>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace kinscene {
namespace xml {

/**
 * Evaluate a math expression ("0.126", "pi/2", "0.1*3", "-cos(pi)") with muParser.
 * Constants: pi, tau.
 *
 * @throws std::runtime_error with the muParser message.
 */
double evalNumberExpr(const char* expr);

/// Numbers
double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback);
double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);

// Whitespace separated list, each entry is an expression without blanks ("0 0 pi/2").
std::vector<double> evalNumberListAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);

// "x y z" lists
Eigen::Vector3d evalVector3AttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);
Eigen::Vector3d evalVector3Attribute(const tinyxml2::XMLElement* elem, const char* attr,
                                     const Eigen::Vector3d& fallback);

/// Text
std::string evalTextAttribute(const tinyxml2::XMLElement* elem, const char* attr, const std::string& fallback);
std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);

}  // namespace xml
}  // namespace kinscene

#endif  // KINSCENE_XML_EXPRESSION_PARSER_H_
