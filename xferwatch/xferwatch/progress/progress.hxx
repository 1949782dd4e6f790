#pragma once

#include <xferwatch/progress/progress-info.hxx>
#include <xferwatch/progress/progress-traits.hxx>
#include <xferwatch/progress/progress-listener.hxx>
#include <xferwatch/progress/progress-dispatcher.hxx>
#include <xferwatch/progress/progress-registry.hxx>
#include <xferwatch/progress/progress-body.hxx>
#include <xferwatch/progress/progress-interceptor.hxx>
#include <xferwatch/progress/progress-manager.hxx>
