#include "fsgate/gateway/messages.hpp"

#include "fsgate/common/fs.hpp"

namespace fsgate::gateway {

namespace {

std::string join_extensions(const OperationSpec &operation, const std::string &conjunction) {
  std::string out;
  for (std::size_t i = 0; i < operation.extensions.size(); ++i) {
    if (i > 0) {
      out += i + 1 == operation.extensions.size() ? conjunction : ", ";
    }
    out += "." + operation.extensions[i];
  }
  return out;
}

} // namespace

common::Result<Locale> locale_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized.empty() || normalized == "en") {
    return common::Result<Locale>::success(Locale::En);
  }
  if (normalized == "ru") {
    return common::Result<Locale>::success(Locale::Ru);
  }
  return common::Result<Locale>::failure(common::ErrorCode::Config, "Unknown locale: " + value);
}

MessageCatalog::MessageCatalog(const Locale locale) : locale_(locale) {}

std::string MessageCatalog::rate_limited() const {
  if (locale_ == Locale::Ru) {
    return "Превышен лимит запросов. Попробуйте позже.";
  }
  return "Too many requests. Please try again later.";
}

std::string MessageCatalog::limiter_unavailable() const {
  if (locale_ == Locale::Ru) {
    return "Ошибка доступа к rate limiter";
  }
  return "Rate limiter is unavailable";
}

std::string MessageCatalog::payload_too_large(const std::uint64_t max_bytes) const {
  const std::string mib = std::to_string(max_bytes / 1024 / 1024);
  if (locale_ == Locale::Ru) {
    return "Размер файла превышает максимальный (" + mib + " МБ)";
  }
  return "File size exceeds the maximum (" + mib + " MB)";
}

std::string MessageCatalog::missing_extension() const {
  if (locale_ == Locale::Ru) {
    return "Файл должен иметь расширение";
  }
  return "File must have an extension";
}

std::string MessageCatalog::disallowed_extension(const OperationSpec &operation) const {
  if (locale_ == Locale::Ru) {
    const std::string allowed = join_extensions(operation, " и ");
    if (operation.mode == OperationMode::Read) {
      return "Разрешено чтение только " + allowed + " файлов";
    }
    if (operation.name == write_binary_operation().name) {
      return "Разрешена запись только " + allowed + " файлов через эту команду";
    }
    return "Разрешена запись только " + allowed + " файлов";
  }
  const std::string verb = operation.mode == OperationMode::Read ? "read" : "written";
  return "Only " + join_extensions(operation, " and ") + " files may be " + verb +
         " by this operation";
}

std::string MessageCatalog::path_not_allowed(const OperationMode mode) const {
  if (locale_ == Locale::Ru) {
    return mode == OperationMode::Read
               ? "Чтение разрешено только из папок: Загрузки, Документы или Рабочий стол"
               : "Сохранение разрешено только в папки: Загрузки, Документы или Рабочий стол";
  }
  return mode == OperationMode::Read
             ? "Reading is only allowed from the Downloads, Documents or Desktop folders"
             : "Saving is only allowed to the Downloads, Documents or Desktop folders";
}

std::string MessageCatalog::io_failure(const IoStep step, const std::string &detail) const {
  if (locale_ == Locale::Ru) {
    switch (step) {
    case IoStep::Write:
      return "Ошибка записи: " + detail;
    case IoStep::Read:
      return "Ошибка чтения: " + detail;
    case IoStep::Metadata:
      return "Ошибка получения информации о файле: " + detail;
    }
  }
  switch (step) {
  case IoStep::Write:
    return "Write error: " + detail;
  case IoStep::Read:
    return "Read error: " + detail;
  case IoStep::Metadata:
    return "Failed to get file information: " + detail;
  }
  return detail;
}

std::string MessageCatalog::invalid_path(const std::string &detail) const {
  if (locale_ == Locale::Ru) {
    return "Недопустимый путь: " + detail;
  }
  return "Invalid path: " + detail;
}

} // namespace fsgate::gateway
