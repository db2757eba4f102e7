/*─────────────────────────────────────────────────────────────
  File: src/common.cpp
  Small helpers for the descriptor types
─────────────────────────────────────────────────────────────
  Responsibilities:
    - Enum <-> name conversion (shapes, step interpretation, field
      kinds and interpretations), used by the envelope writer, the
      CGNS writer and the CLI
    - Field type construction and slicing
    - Whitespace trimming, case folding and list splitting for the
      command line and settings parsing

  This module performs no I/O.
─────────────────────────────────────────────────────────────*/
#include "meshstep/common.hpp"

#include <algorithm>
#include <cctype>

namespace meshstep {

/*=====================================================================
  Shape names
=====================================================================*/
std::string shape_to_string(Shape s)
{
    switch (s)
    {
        case Shape::Line:          return "Line";
        case Shape::Quadrilateral: return "Quadrilateral";
        case Shape::Hexahedron:    return "Hexahedron";
    }
    return "??";
}

Shape shape_from_string(const std::string& tok)
{
    const std::string t = casefold(tok);
    if (t == "line")          return Shape::Line;
    if (t == "quadrilateral") return Shape::Quadrilateral;
    if (t == "hexahedron")    return Shape::Hexahedron;
    throw std::invalid_argument("Invalid shape token \"" + tok + '"');
}

/*
  Parametric dimension 1..3 maps onto Line..Hexahedron.
*/
Shape shape_from_pardim(int pardim)
{
    switch (pardim)
    {
        case 1: return Shape::Line;
        case 2: return Shape::Quadrilateral;
        case 3: return Shape::Hexahedron;
        default:
            throw std::invalid_argument("No shape with parametric dimension " +
                                        std::to_string(pardim));
    }
}

int shape_pardim(Shape s)
{
    return static_cast<int>(s) + 1;
}

/*=====================================================================
  StepInterpretation names
=====================================================================*/
std::string step_interpretation_to_string(StepInterpretation s)
{
    switch (s)
    {
        case StepInterpretation::Time:       return "Time";
        case StepInterpretation::Load:       return "Load";
        case StepInterpretation::Eigenvalue: return "Eigenvalue";
        case StepInterpretation::Generic:    return "Generic";
    }
    return "??";
}

StepInterpretation step_interpretation_from_string(const std::string& tok)
{
    const std::string t = casefold(tok);
    if (t == "time")       return StepInterpretation::Time;
    if (t == "load")       return StepInterpretation::Load;
    if (t == "eigenvalue") return StepInterpretation::Eigenvalue;
    if (t == "generic")    return StepInterpretation::Generic;
    throw std::invalid_argument("Invalid step interpretation \"" + tok + '"');
}

/*=====================================================================
  Field kinds
=====================================================================*/
std::string field_kind_to_string(FieldKind k)
{
    switch (k)
    {
        case FieldKind::Scalar:   return "Scalar";
        case FieldKind::Vector:   return "Vector";
        case FieldKind::Geometry: return "Geometry";
    }
    return "??";
}

std::string interpretation_to_string(Interpretation i)
{
    switch (i)
    {
        case Interpretation::Generic:      return "Generic";
        case Interpretation::Displacement: return "Displacement";
        case Interpretation::Eigenmode:    return "Eigenmode";
        case Interpretation::Flow:         return "Flow";
    }
    return "??";
}

/*=====================================================================
  CoordinateSystem
=====================================================================*/
std::string CoordinateSystem::to_string() const
{
    std::string out = name + "(";
    for (size_t i = 0; i < parameters.size(); ++i) {
        if (i) out += ", ";
        out += parameters[i];
    }
    return out + ")";
}

bool CoordinateSystem::fits_system_name(const std::string& code) const
{
    return casefold(code) == casefold(name);
}

/*=====================================================================
  FieldType named constructors
=====================================================================*/
FieldType FieldType::scalar(Interpretation i)
{
    if (i != Interpretation::Generic && i != Interpretation::Eigenmode)
        throw std::invalid_argument("Scalar fields are either generic or eigenmodes");
    FieldType t;
    t.kind = FieldKind::Scalar;
    t.ncomps = 1;
    t.interpretation = i;
    return t;
}

FieldType FieldType::vector(int ncomps, Interpretation i)
{
    if (ncomps < 1)
        throw std::invalid_argument("Vector fields need at least one component");
    FieldType t;
    t.kind = FieldKind::Vector;
    t.ncomps = ncomps;
    t.interpretation = i;
    return t;
}

FieldType FieldType::geometry(int ncomps, CoordinateSystem coords)
{
    if (ncomps < 1 || ncomps > 3)
        throw std::invalid_argument("Geometry fields carry 1 to 3 coordinates");
    FieldType t;
    t.kind = FieldKind::Geometry;
    t.ncomps = ncomps;
    t.coords = std::move(coords);
    return t;
}

/*
  One component of a vector keeps the eigenmode interpretation and
  drops the others (a single displacement component is just a scalar).
*/
FieldType FieldType::slice() const
{
    if (kind == FieldKind::Geometry)
        throw std::logic_error("Geometry fields cannot be sliced");
    if (interpretation == Interpretation::Eigenmode)
        return scalar(Interpretation::Eigenmode);
    return scalar();
}

const CoordinateSystem& Field::coords() const
{
    if (!is_geometry())
        throw std::logic_error("Field '" + name + "' is not a geometry");
    return type.coords;
}

/*=====================================================================
  Text helpers
=====================================================================*/
std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    return s.substr(start, end - start);
}

std::string casefold(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/*
  Split "a, b,,c" into {"a", "b", "c"}: parts are trimmed and empty
  parts dropped.
*/
std::vector<std::string> split_list(const std::string& s, char sep)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        std::string part = trim(s.substr(
            start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!part.empty())
            parts.push_back(part);
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return parts;
}

} // namespace meshstep
