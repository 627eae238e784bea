#pragma once

namespace parsercraft {

struct LanguageConfig;
class Pipeline;
class ConfigError;

}
