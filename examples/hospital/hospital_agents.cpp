#include "hospital_agents.hpp"

#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <regex>
#include <sstream>
#include <thread>

namespace hospital {

using a2a::json;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

// "MR" / "APT" + zero-padded counter
std::string sequence_id(const char* prefix, size_t n) {
  std::ostringstream out;
  out << prefix << std::setw(6) << std::setfill('0') << n;
  return out.str();
}

// "key: value" lines, first occurrence of each key wins
std::map<std::string, std::string> parse_fields(const std::string& text, std::initializer_list<const char*> keys) {
  std::map<std::string, std::string> fields;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    auto lowered = to_lower(line);
    for (const char* key : keys) {
      auto pos = lowered.find(std::string(key) + ":");
      if (pos != std::string::npos && !fields.count(key)) {
        fields[key] = trim(line.substr(pos + std::string(key).size() + 1));
        break;
      }
    }
  }
  return fields;
}

std::string find_email(const std::string& text) {
  static const std::regex email_regex(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+)");
  std::smatch match;
  return std::regex_search(text, match, email_regex) ? match.str() : "";
}

a2a::AgentSkill skill(std::string id, std::string name, std::string description, std::set<std::string> tags, std::vector<std::string> examples) {
  a2a::AgentSkill s;
  s.id = std::move(id);
  s.name = std::move(name);
  s.description = std::move(description);
  s.tags = std::move(tags);
  s.examples = std::move(examples);
  return s;
}

}  // namespace

// --- Patient registry ---

json Patient::to_json() const {
  return {{"id", id}, {"name", name}, {"email", email}, {"phone", phone}, {"medical_record_number", medical_record_number}};
}

HandlerResult PatientRegistryHandler::handle(const Message& inbound, const Task&, const HandlerContext&) {
  auto text = inbound.text();
  auto lowered = to_lower(text);

  if (contains(lowered, "register")) {
    return HandlerResult::success(register_patient(text));
  }
  if (contains(lowered, "lookup") || contains(lowered, "find")) {
    return HandlerResult::success(lookup_patient(text));
  }
  return HandlerResult::success(Message::agent("I can help you with patient registration and lookup. Please specify what you'd like to do."));
}

size_t PatientRegistryHandler::size() const {
  std::lock_guard lock(mutex_);
  return patients_.size();
}

Message PatientRegistryHandler::register_patient(const std::string& text) {
  auto fields = parse_fields(text, {"name", "email", "phone"});

  if (fields["name"].empty() || fields["email"].empty() || fields["phone"].empty()) {
    return Message::agent("Please provide patient name, email, and phone number for registration.");
  }

  std::lock_guard lock(mutex_);
  Patient patient{a2a::UUID::generate(), fields["name"], fields["email"], fields["phone"], sequence_id("MR", patients_.size() + 1)};
  patients_[patient.id] = patient;
  by_email_[patient.email] = patient.id;
  by_mrn_[patient.medical_record_number] = patient.id;

  spdlog::info("[Patient] Registered {} as {}", patient.name, patient.medical_record_number);
  return Message::agent("Patient registered successfully!", {{"patient_id", patient.id},
                                                            {"medical_record_number", patient.medical_record_number},
                                                            {"name", patient.name},
                                                            {"status", "registered"}});
}

Message PatientRegistryHandler::lookup_patient(const std::string& text) const {
  static const std::regex mrn_regex(R"(MR\d+)");

  std::smatch match;
  std::optional<std::string> patient_id;
  auto email = find_email(text);
  {
    std::lock_guard lock(mutex_);
    if (!email.empty()) {
      auto it = by_email_.find(email);
      if (it != by_email_.end()) patient_id = it->second;
    } else if (std::regex_search(text, match, mrn_regex)) {
      auto it = by_mrn_.find(match.str());
      if (it != by_mrn_.end()) patient_id = it->second;
    } else {
      return Message::agent("Please provide either an email address or medical record number for lookup.");
    }

    if (patient_id) {
      return Message::agent("Patient found!", patients_.at(*patient_id).to_json());
    }
  }
  return Message::agent("Patient not found in our records.");
}

// --- Secure patient registry ---

std::string mask_name(const std::string& name) {
  std::istringstream words(name);
  std::string word;
  std::string masked;
  while (words >> word) {
    if (!masked.empty()) masked += ' ';
    masked += word.front();
    masked += std::string(word.size() - 1, '*');
  }
  return masked;
}

std::string mask_email(const std::string& email) {
  auto at = email.find('@');
  if (at == std::string::npos || at == 0) return std::string(email.size(), '*');
  return email.substr(0, 1) + "***" + email.substr(at);
}

// Keeps the last four digits
std::string mask_ssn(const std::string& ssn) {
  std::string digits;
  for (char c : ssn) {
    if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
  }
  if (digits.size() < 4) return ssn.empty() ? "" : "XXX-XX-XXXX";
  return "XXX-XX-" + digits.substr(digits.size() - 4);
}

// Keeps the year
std::string mask_dob(const std::string& dob) {
  if (dob.size() < 4) return dob.empty() ? "" : "****";
  return dob.substr(0, 4) + "-**-**";
}

std::string sha256_hex(const std::string& data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char byte : hash) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

json AccessLogEntry::to_json() const {
  return {{"timestamp", timestamp}, {"action", action}, {"patient_id", patient_id}, {"user_context", context_id}, {"session_id", session_id}};
}

json SecurePatientRecord::to_json() const {
  return {{"id", id},
          {"name", name_masked},
          {"email", email_masked},
          {"dob", dob_masked},
          {"ssn", ssn_masked},
          {"created_at", created_at}};
}

HandlerResult SecurePatientHandler::handle(const Message& inbound, const Task&, const HandlerContext& ctx) {
  auto text = inbound.text();
  auto lowered = to_lower(text);

  log_access("data_access", "unknown", ctx.context_id);

  if (contains(lowered, "register")) {
    return HandlerResult::success(secure_register(text, ctx));
  }
  if (contains(lowered, "verify")) {
    return HandlerResult::success(verify_identity(text, ctx));
  }
  return HandlerResult::success(Message::agent("Secure HIPAA-compliant patient services available."));
}

Message SecurePatientHandler::secure_register(const std::string& text, const HandlerContext& ctx) {
  auto fields = parse_fields(text, {"name", "email", "dob", "ssn"});
  if (fields["name"].empty() || fields["email"].empty()) {
    return Message::agent("Please provide patient name and email for secure registration.");
  }

  SecurePatientRecord record;
  record.id = a2a::UUID::generate();
  record.name_masked = mask_name(fields["name"]);
  record.email_masked = mask_email(fields["email"]);
  record.email_digest = sha256_hex(to_lower(fields["email"]));
  record.dob_masked = mask_dob(fields["dob"]);
  record.ssn_masked = mask_ssn(fields["ssn"]);
  record.created_at = a2a::now_iso8601();
  {
    std::lock_guard lock(mutex_);
    records_[record.id] = record;
  }
  log_access("patient_registration", record.id, ctx.context_id);

  json data = {{"patient_id", record.id},
               {"registration_status", "completed_secure"},
               {"compliance_level", "HIPAA"},
               {"audit_logged", true}};
  return Message::agent("Patient registered securely with HIPAA compliance.", std::move(data));
}

Message SecurePatientHandler::verify_identity(const std::string& text, const HandlerContext& ctx) {
  auto email = find_email(text);
  if (email.empty()) {
    return Message::agent("Please provide the registered email address for verification.");
  }

  auto digest = sha256_hex(to_lower(email));
  std::optional<SecurePatientRecord> found;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, record] : records_) {
      if (record.email_digest == digest) {
        found = record;
        break;
      }
    }
  }

  log_access("identity_verification", found ? found->id : "unknown", ctx.context_id);
  if (!found) {
    return Message::agent("No matching patient record.");
  }
  return Message::agent("Patient identity verified.", found->to_json());
}

void SecurePatientHandler::log_access(const std::string& action, const std::string& patient_id, const std::string& context_id) {
  AccessLogEntry entry{a2a::now_iso8601(), action, patient_id, context_id, a2a::UUID::generate()};
  {
    std::lock_guard lock(mutex_);
    audit_log_.push_back(entry);
  }

  spdlog::info("[Audit] {} patient={} context={} session={}", entry.action, entry.patient_id, entry.context_id, entry.session_id);
  a2a::Bus::instance().publish(PatientDataAccessed{entry});
}

std::vector<AccessLogEntry> SecurePatientHandler::audit_log() const {
  std::lock_guard lock(mutex_);
  return audit_log_;
}

std::vector<SecurePatientRecord> SecurePatientHandler::records() const {
  std::lock_guard lock(mutex_);
  std::vector<SecurePatientRecord> out;
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

// --- Doctor roster ---

DoctorRosterHandler::DoctorRosterHandler(std::chrono::system_clock::time_point now) {
  const std::vector<std::array<const char*, 3>> sample = {
      {"Dr. Sarah Johnson", "Cardiology", "Heart Center"},
      {"Dr. Michael Chen", "Dermatology", "Skin Care"},
      {"Dr. Emily Rodriguez", "Pediatrics", "Children's Health"},
      {"Dr. David Smith", "Orthopedics", "Bone & Joint"},
      {"Dr. Lisa Wong", "Emergency Medicine", "Emergency Department"},
  };

  // Slots for the next 7 days
  std::vector<std::string> slots;
  for (int day = 1; day <= 7; ++day) {
    auto t = std::chrono::system_clock::to_time_t(now + std::chrono::hours(24 * day));
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream date;
    date << std::put_time(&tm, "%Y-%m-%d");
    for (int hour : {9, 10, 11, 14, 15, 16}) {
      std::ostringstream slot;
      slot << date.str() << "T" << std::setw(2) << std::setfill('0') << hour << ":00:00";
      slots.push_back(slot.str());
    }
  }

  for (const auto& [name, specialty, department] : sample) {
    doctors_.push_back(Doctor{a2a::UUID::generate(), name, specialty, department, slots});
  }
}

HandlerResult DoctorRosterHandler::handle(const Message& inbound, const Task&, const HandlerContext&) {
  auto lowered = to_lower(inbound.text());

  if (contains(lowered, "find") || contains(lowered, "search")) {
    return HandlerResult::success(search(lowered));
  }
  if (contains(lowered, "availability") || contains(lowered, "available")) {
    return HandlerResult::success(availability());
  }
  return HandlerResult::success(Message::agent("I can help you search for doctors or check their availability. What would you like to do?"));
}

Message DoctorRosterHandler::search(const std::string& lowered) const {
  std::optional<std::string> wanted;
  for (const char* specialty : {"cardiology", "dermatology", "pediatrics", "orthopedics", "emergency"}) {
    if (contains(lowered, specialty)) {
      wanted = specialty;
      break;
    }
  }

  json matches = json::array();
  for (const auto& doctor : doctors_) {
    if (wanted && !contains(to_lower(doctor.specialty), *wanted)) continue;
    matches.push_back({{"id", doctor.id},
                       {"name", doctor.name},
                       {"specialty", doctor.specialty},
                       {"department", doctor.department},
                       {"available_slots_count", doctor.available_slots.size()}});
  }

  if (matches.empty()) {
    return Message::agent("No doctors found matching your criteria.");
  }
  auto text = "Found " + std::to_string(matches.size()) + " doctors matching your criteria:";
  return Message::agent(text, {{"doctors", matches}});
}

Message DoctorRosterHandler::availability() const {
  json availability = json::array();
  for (const auto& doctor : doctors_) {
    auto count = std::min<size_t>(3, doctor.available_slots.size());
    std::vector<std::string> next(doctor.available_slots.begin(), doctor.available_slots.begin() + count);
    availability.push_back(
        {{"doctor_id", doctor.id}, {"doctor_name", doctor.name}, {"specialty", doctor.specialty}, {"next_available_slots", next}});
  }
  return Message::agent("Here's the current availability:", {{"availability", availability}});
}

// --- Appointment booking ---

json Appointment::to_json() const {
  return {{"id", id},
          {"patient_id", patient_id},
          {"doctor_id", doctor_id},
          {"datetime_slot", datetime_slot},
          {"department", department},
          {"status", status},
          {"notes", notes}};
}

HandlerResult AppointmentBookingHandler::handle(const Message& inbound, const Task&, const HandlerContext&) {
  auto text = inbound.text();
  auto lowered = to_lower(text);

  if (contains(lowered, "book") || contains(lowered, "schedule")) {
    return HandlerResult::success(book());
  }
  if (contains(lowered, "view") || contains(lowered, "list")) {
    return HandlerResult::success(view());
  }
  if (contains(lowered, "cancel")) {
    return HandlerResult::success(cancel(text));
  }
  return HandlerResult::success(
      Message::agent("I can help you book appointments, view existing appointments, or cancel appointments. What would you like to do?"));
}

Message AppointmentBookingHandler::book() {
  std::lock_guard lock(mutex_);
  // TODO: resolve patient and doctor ids through the patient and doctor agents
  Appointment appointment{sequence_id("APT", appointments_.size() + 1), "patient_123", "doctor_456", "2024-01-15T10:00:00",
                          "Cardiology",                                 "scheduled",   "Regular checkup"};
  appointments_[appointment.id] = appointment;

  spdlog::info("[Booking] Booked {}", appointment.id);
  return Message::agent("Appointment booked successfully!", appointment.to_json());
}

Message AppointmentBookingHandler::view() const {
  std::lock_guard lock(mutex_);
  json list = json::array();
  for (const auto& [id, appointment] : appointments_) {
    list.push_back(appointment.to_json());
  }
  auto text = "Found " + std::to_string(list.size()) + " appointments:";
  return Message::agent(text, {{"appointments", list}});
}

Message AppointmentBookingHandler::cancel(const std::string& text) {
  std::lock_guard lock(mutex_);
  for (auto& [id, appointment] : appointments_) {
    if (contains(text, id)) {
      appointment.status = "cancelled";
      spdlog::info("[Booking] Cancelled {}", id);
      return Message::agent("Appointment " + id + " has been cancelled.");
    }
  }
  return Message::agent("Please provide a valid appointment ID to cancel.");
}

// --- Streaming analysis ---

StreamingAnalysisHandler::StreamingAnalysisHandler(std::vector<std::string> stages, std::chrono::milliseconds stage_delay)
    : stages_(std::move(stages)), stage_delay_(stage_delay) {}

HandlerResult StreamingAnalysisHandler::handle(const Message& inbound, const Task& task, const HandlerContext& ctx) {
  for (const auto& stage : stages_) {
    if (stage_delay_.count() > 0) {
      std::this_thread::sleep_for(stage_delay_);
    }
    spdlog::debug("[Analysis] Task {}: {}", task.id, stage);
    ctx.progress(stage);
  }

  return HandlerResult::success(Message::agent("Analysis complete.", {{"request", inbound.text()}, {"stages_completed", stages_.size()}}));
}

// --- Role defaults ---

std::optional<a2a::Config> default_config(const std::string& role) {
  a2a::Config config;

  if (role == "coordinator") {
    config.server.port = 8000;
    config.agent.name = "Hospital Coordinator Agent";
    config.agent.description = "Main coordinator that orchestrates appointment booking workflows across all hospital systems";
    config.agent.skills = {skill("appointment-orchestration", "Appointment Orchestration",
                                 "Coordinate complete appointment booking workflow across all hospital agents",
                                 {"orchestration", "workflow", "coordination"},
                                 {"Book appointment for John Doe with cardiology", "Help me schedule a checkup with Dr. Johnson next week"})};
    config.pipeline = {
        {"Checking patient information...", "http://localhost:8001/a2a/v1", "lookup patient in: ", "patient_info", std::chrono::seconds(30)},
        {"Finding available doctors...", "http://localhost:8002/a2a/v1", "find doctors for: ", "doctor_availability", std::chrono::seconds(30)},
        {"Booking appointment...", "http://localhost:8003/a2a/v1", "book appointment: ", "booking_result", std::chrono::seconds(30)},
    };
  } else if (role == "patient") {
    config.server.port = 8001;
    config.agent.name = "Patient Registration Agent";
    config.agent.description = "Handles patient registration, verification, and lookup services for the hospital system";
    config.agent.skills = {
        skill("patient-registration", "Patient Registration", "Register new patients and validate existing patient information",
              {"registration", "patient", "verification"},
              {"Register a new patient with name John Doe, email john@email.com, phone 123-456-7890",
               "Verify patient information for medical record number MR123456"}),
        skill("patient-lookup", "Patient Lookup", "Look up existing patient records and information", {"lookup", "patient", "records"},
              {"Find patient by email: john@email.com", "Look up patient by medical record number: MR123456"}),
    };
  } else if (role == "doctor") {
    config.server.port = 8002;
    config.agent.name = "Doctor Availability Agent";
    config.agent.description = "Manages doctor schedules and availability for appointment booking";
    config.agent.skills = {
        skill("doctor-search", "Doctor Search", "Search for doctors by specialty, department, or name", {"doctor", "search", "specialty", "department"},
              {"Find cardiologists available this week", "Search for doctors in Emergency Department", "Find Dr. Smith's availability"}),
        skill("availability-check", "Availability Check", "Check doctor availability for specific dates and times",
              {"availability", "schedule", "appointment"},
              {"Check Dr. Johnson's availability for next Monday", "Find available slots in Cardiology for this week"}),
    };
  } else if (role == "booking") {
    config.server.port = 8003;
    config.agent.name = "Appointment Booking Agent";
    config.agent.description = "Handles appointment booking, modification, and cancellation services";
    config.agent.skills = {
        skill("book-appointment", "Book Appointment", "Book new appointments for patients with available doctors", {"booking", "appointment", "schedule"},
              {"Book appointment for patient MR123456 with Dr. Johnson on 2024-01-15 at 10:00",
               "Schedule appointment for john@email.com with cardiology department"}),
        skill("appointment-management", "Appointment Management", "View, modify, or cancel existing appointments",
              {"appointment", "management", "cancel", "modify"}, {"View appointments for patient MR123456", "Cancel appointment ID APT123456"}),
    };
  } else if (role == "secure-patient") {
    config.server.port = 8004;
    config.agent.name = "HIPAA-Compliant Patient Agent";
    config.agent.description = "Secure patient registration service with HIPAA compliance features";
    config.agent.skills = {skill("secure-patient-registration", "Secure Patient Registration",
                                 "HIPAA-compliant patient registration with encryption and audit logging",
                                 {"registration", "patient", "HIPAA", "secure"},
                                 {"Register new patient with encrypted PHI", "Verify patient identity with secure lookup"})};
    // Keys come from the config file or A2A_API_KEYS
    config.auth.enabled = true;
  } else if (role == "analysis") {
    config.server.port = 8005;
    config.agent.name = "Streaming Medical Analysis Agent";
    config.agent.description = "Provides streaming medical analysis with real-time updates";
    config.agent.skills = {skill("long-running-analysis", "Long-Running Medical Analysis",
                                 "Perform complex medical data analysis with streaming updates", {"analysis", "streaming", "medical"},
                                 {"Analyze patient medical history with real-time updates"})};
    config.agent.capabilities[a2a::capability::kStreaming] = true;
  } else {
    return std::nullopt;
  }

  return config;
}

a2a::CapabilityHandlerPtr make_handler(const std::string& role, const a2a::Config& config, a2a::DownstreamCallerPtr caller) {
  if (role == "coordinator") {
    a2a::CoordinatorOptions options;
    options.success_text = "Appointment booking workflow completed successfully!";
    options.error_prefix = "Error in appointment booking workflow: ";
    return std::make_shared<a2a::CoordinatorHandler>(config.pipeline, std::move(caller), options);
  }
  if (role == "patient") return std::make_shared<PatientRegistryHandler>();
  if (role == "doctor") return std::make_shared<DoctorRosterHandler>();
  if (role == "booking") return std::make_shared<AppointmentBookingHandler>();
  if (role == "secure-patient") return std::make_shared<SecurePatientHandler>();
  if (role == "analysis") {
    return std::make_shared<StreamingAnalysisHandler>(config.stream.stages, std::chrono::milliseconds(config.stream.stage_delay_ms));
  }
  return nullptr;
}

}  // namespace hospital
