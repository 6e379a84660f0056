// folio.h
// Copyright (c) 2022, zhiayang
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "folio/units.h"
#include "folio/colour.h"
#include "folio/style.h"
#include "folio/area.h"
#include "folio/element.h"
#include "folio/document.h"
#include "folio/font_family.h"
#include "folio/font_backend.h"
#include "folio/cell_decorator.h"
#include "folio/page_decorator.h"
#include "folio/render_backend.h"
#include "folio/recording_backend.h"
#include "folio/document_settings.h"
