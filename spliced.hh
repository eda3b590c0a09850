//  ┏━┓┏━┓╻  ╻┏━╸┏━╸╺┳┓
//  ┗━┓┣━┛┃  ┃┃  ┣╸  ┃┃
//  ┗━┛╹  ┗━╸╹┗━╸┗━╸╺┻┛
//  Variable resolution & schema validation for workflow nodes
//  version 0.1.0 | MIT License
#pragma once

#include "spliced/errors.hh"
#include "spliced/value.hh"
#include "spliced/expression.hh"
#include "spliced/deferred.hh"
#include "spliced/context.hh"
#include "spliced/schema.hh"
#include "spliced/document.hh"
