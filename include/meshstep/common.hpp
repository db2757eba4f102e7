/*─────────────────────────────────────────────────────────────
  File: include/meshstep/common.hpp
  Descriptor types shared across meshstep modules

  This header defines:
  - The immutable descriptors a Source hands out: Basis, Field,
    Zone, Step and SourceProperties
  - Field classification (Scalar / Vector / Geometry) and the
    coordinate-system tag carried by geometry fields
  - Name <-> enum helpers used by the writers and the CLI
  - A CGNS error-handling macro that converts C-style errors into
    C++ exceptions

  Design intent:
  - No heavy dependencies
  - No ownership of large data (payloads live in payload.hpp)
  - Plain value types suitable for copying, comparing and logging
─────────────────────────────────────────────────────────────*/
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshstep {

/*======================================================================
  Shape
======================================================================*/
/*
  Topological kind of a zone, identified by its parametric dimension:
    Line          : pardim 1
    Quadrilateral : pardim 2
    Hexahedron    : pardim 3

  Ordering is stable and relied upon by shape_from_pardim().
*/
enum class Shape : uint8_t {
    Line,
    Quadrilateral,
    Hexahedron
};

std::string shape_to_string(Shape s);
Shape       shape_from_string(const std::string& tok);
Shape       shape_from_pardim(int pardim);
int         shape_pardim(Shape s);

/*======================================================================
  StepInterpretation
======================================================================*/
/*
  How the optional Step::value is presented downstream.
    Time       : physical time
    Load       : load factor / continuation parameter
    Eigenvalue : each step is one eigenmode, value is its eigenvalue
    Generic    : plain ordinal, value has no physical meaning
*/
enum class StepInterpretation : uint8_t {
    Time,
    Load,
    Eigenvalue,
    Generic
};

std::string        step_interpretation_to_string(StepInterpretation s);
StepInterpretation step_interpretation_from_string(const std::string& tok);

/*======================================================================
  Index / point helpers
======================================================================*/

/*----------- Point ------------------*/
/*
  One point in physical space. Zones with fewer than three physical
  coordinates pad with 0.0.
*/
using Point = std::array<double, 3>;

/*----------- CoordinateSystem -------*/
/*
  Coordinate-system tag of a geometry field.

  Fields:
    name       : system name, compared case-insensitively ("Generic",
                 "Geodetic", "UTM", ...)
    parameters : free-form parameters ("WGS84", "33", "north", ...)

  Nothing in meshstep converts between systems; the tag is carried
  through so writers and users can tell which geometry is which.
*/
struct CoordinateSystem
{
    std::string              name = "Generic";
    std::vector<std::string> parameters;

    std::string to_string() const;             ///< "Name(p1, p2)"
    bool fits_system_name(const std::string& code) const;

    bool operator==(const CoordinateSystem& o) const
    {
        return name == o.name && parameters == o.parameters;
    }
    bool operator!=(const CoordinateSystem& o) const { return !(*this == o); }
};

/*======================================================================
  Basis
======================================================================*/
/*
  A named coordinate/function space. Bases are compared by name: two
  Basis objects with the same name denote the same space.
*/
struct Basis
{
    std::string name;
    int         pardim = 3;

    bool operator==(const Basis& o) const { return name == o.name; }
    bool operator!=(const Basis& o) const { return !(*this == o); }
};

/*======================================================================
  FieldType
======================================================================*/
enum class FieldKind : uint8_t { Scalar, Vector, Geometry };

/*
  Physical interpretation of scalar and vector data. Only Generic and
  Eigenmode are valid for scalars.
*/
enum class Interpretation : uint8_t {
    Generic,
    Displacement,
    Eigenmode,
    Flow
};

std::string field_kind_to_string(FieldKind k);
std::string interpretation_to_string(Interpretation i);

/*
  Shape of the values a Field carries.

  Use the named constructors; a Scalar always has ncomps == 1 and a
  Geometry always carries a coordinate system.
*/
struct FieldType
{
    FieldKind        kind           = FieldKind::Scalar;
    int              ncomps         = 1;
    Interpretation   interpretation = Interpretation::Generic;
    CoordinateSystem coords;

    static FieldType scalar(Interpretation i = Interpretation::Generic);
    static FieldType vector(int ncomps, Interpretation i = Interpretation::Generic);
    static FieldType geometry(int ncomps, CoordinateSystem coords = {});

    /* Type of one component of this type (vectors become scalars). */
    FieldType slice() const;

    bool operator==(const FieldType& o) const
    {
        return kind == o.kind && ncomps == o.ncomps &&
               interpretation == o.interpretation && coords == o.coords;
    }
    bool operator!=(const FieldType& o) const { return !(*this == o); }
};

/*======================================================================
  Field
======================================================================*/
struct Field
{
    std::string name;
    FieldType   type;
    bool        cellwise   = false;   ///< one value per cell instead of per node
    bool        splittable = true;    ///< may be decomposed into components

    int  num_comps()       const { return type.ncomps; }
    bool is_scalar()       const { return type.kind == FieldKind::Scalar; }
    bool is_vector()       const { return type.kind == FieldKind::Vector; }
    bool is_geometry()     const { return type.kind == FieldKind::Geometry; }
    bool is_eigenmode()    const
    {
        return !is_geometry() && type.interpretation == Interpretation::Eigenmode;
    }
    bool is_displacement() const
    {
        return is_vector() && type.interpretation == Interpretation::Displacement;
    }

    /* Only meaningful for geometry fields; throws std::logic_error otherwise. */
    const CoordinateSystem& coords() const;

    bool fits_system_name(const std::string& code) const
    {
        return is_geometry() && type.coords.fits_system_name(code);
    }

    bool operator==(const Field& o) const { return name == o.name; }
    bool operator!=(const Field& o) const { return !(*this == o); }
};

/*======================================================================
  Zone
======================================================================*/
/*
  One connected piece of the domain.

    key    : stable identifier, unique within a Source
    shape  : topological kind
    coords : corner points (2, 4 or 8 for Line/Quadrilateral/Hexahedron),
             ordered with the first parametric axis fastest
*/
struct Zone
{
    std::string        key;
    Shape              shape = Shape::Hexahedron;
    std::vector<Point> coords;

    bool operator==(const Zone& o) const { return key == o.key; }
    bool operator!=(const Zone& o) const { return !(*this == o); }
};

/*======================================================================
  Step
======================================================================*/
struct Step
{
    int                   index = 0;
    std::optional<double> value;
};

/*======================================================================
  SourceProperties
======================================================================*/
/*
  Fixed per Source instance and queried once per pass.

    instantaneous      : no time dependence at all (exactly one step)
    globally_keyed     : zone keys are stable across steps and bases
    discrete_topology  : topology is replaced wholesale, never interpolated
    single_basis       : exactly one basis exists
    single_zoned       : exactly one zone exists
    step_interpretation: how Step::value is presented downstream
*/
struct SourceProperties
{
    bool               instantaneous       = false;
    bool               globally_keyed      = false;
    bool               discrete_topology   = false;
    bool               single_basis        = false;
    bool               single_zoned        = false;
    StepInterpretation step_interpretation = StepInterpretation::Generic;
};

/*======================================================================
  Text helpers (src/common.cpp)
======================================================================*/
std::string trim(const std::string& s);
std::string casefold(const std::string& s);
std::vector<std::string> split_list(const std::string& s, char sep = ',');

/*----------- CG_CALL -----------------------*/
/*
  Macro wrapper for CGNS C API calls.

  Behavior:
    - Evaluates a CGNS function call
    - If the return value is non-zero:
        * Calls cg_error_print() to emit CGNS diagnostics
        * Throws the given exception type with the provided message

  Example:
    CG_CALL(cg_open(...), SerializationFailure, "CGNS: cannot open " + path);

  Requirements:
    - This macro expects cg_error_print() to be available (from cgnslib.h).
*/
#define CG_CALL(expr, exc, msg)                             \
    do {                                                    \
        if (int _cgstat = (expr)) {                         \
            (void)_cgstat;                                  \
            cg_error_print();                               \
            throw exc(msg);                                 \
        }                                                   \
    } while (0)

} // namespace meshstep
