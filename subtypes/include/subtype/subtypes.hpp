#ifndef SUBTYPE_SUBTYPES_HPP
#define SUBTYPE_SUBTYPES_HPP

// Umbrella include for the subtype layer.
//
// Provides: the subtype capability (val, sub, insub, insubd, innew), the
// Sig refinement and NewType wrapper, the inherited equality of subtypes,
// and the subtype law checkers.

#include <subtype/sig.hpp>
#include <subtype/sub_eq.hpp>
#include <subtype/sub_laws.hpp>
#include <subtype/subtype.hpp>

#endif // SUBTYPE_SUBTYPES_HPP
