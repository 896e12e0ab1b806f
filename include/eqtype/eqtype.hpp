#ifndef EQTYPE_EQTYPE_HPP
#define EQTYPE_EQTYPE_HPP

#include <eqtype/eq.hpp>
#include <eqtype/derive.hpp>
#include <eqtype/instances.hpp>
#include <eqtype/pred.hpp>
#include <eqtype/rel.hpp>
#include <eqtype/composite.hpp>
#include <eqtype/tagged.hpp>
#include <eqtype/laws.hpp>

#endif // EQTYPE_EQTYPE_HPP
