#ifndef RECOMPOSE_H
#define RECOMPOSE_H

#include <recompose/recompose_export.h>
#include <recompose/recompose_forward_declarations.h>

#include <recompose/types/any_compose.h>
#include <recompose/types/compose.h>
#include <recompose/types/compose_traits.h>
#include <recompose/types/data.h>
#include <recompose/types/error.h>
#include <recompose/types/hooks.h>
#include <recompose/types/scope_arena.h>
#include <recompose/types/scope_state.h>

#include <recompose/types/compose/dyn_compose.h>
#include <recompose/types/compose/from_fn.h>
#include <recompose/types/compose/from_iter.h>
#include <recompose/types/compose/memo.h>
#include <recompose/types/compose/optional.h>
#include <recompose/types/compose/result.h>
#include <recompose/types/compose/sequence.h>

#include <recompose/runtime/compose_observer.h>
#include <recompose/runtime/composer.h>
#include <recompose/runtime/runtime.h>
#include <recompose/runtime/task.h>
#include <recompose/runtime/update.h>

#endif // RECOMPOSE_H
