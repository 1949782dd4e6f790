#pragma once

#include <xferwatch/version.hxx>
#include <xferwatch/diagnostics.hxx>
#include <xferwatch/http/http.hxx>
#include <xferwatch/progress/progress.hxx>
