#pragma once

#include <xferwatch/http/http-types.hxx>
#include <xferwatch/http/http-body.hxx>
#include <xferwatch/http/http-request.hxx>
#include <xferwatch/http/http-response.hxx>
#include <xferwatch/http/http-interceptor.hxx>
#include <xferwatch/http/http-client.hxx>
