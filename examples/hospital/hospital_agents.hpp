#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "a2a/a2a.hpp"

namespace hospital {

using a2a::HandlerContext;
using a2a::HandlerResult;
using a2a::Message;
using a2a::Task;

struct Patient {
  std::string id;
  std::string name;
  std::string email;
  std::string phone;
  std::string medical_record_number;

  a2a::json to_json() const;
};

// Registration ("register" + name:/email:/phone: lines) and lookup by email
// or MR number
class PatientRegistryHandler : public a2a::CapabilityHandler {
 public:
  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

  size_t size() const;

 private:
  Message register_patient(const std::string& text);
  Message lookup_patient(const std::string& text) const;

  mutable std::mutex mutex_;
  std::map<std::string, Patient> patients_;
  std::map<std::string, std::string> by_email_;
  std::map<std::string, std::string> by_mrn_;
};

struct Doctor {
  std::string id;
  std::string name;
  std::string specialty;
  std::string department;
  std::vector<std::string> available_slots;
};

// Roster search by specialty keyword and availability listing
class DoctorRosterHandler : public a2a::CapabilityHandler {
 public:
  explicit DoctorRosterHandler(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

  const std::vector<Doctor>& doctors() const {
    return doctors_;
  }

 private:
  Message search(const std::string& lowered) const;
  Message availability() const;

  std::vector<Doctor> doctors_;  // immutable after construction
};

struct Appointment {
  std::string id;
  std::string patient_id;
  std::string doctor_id;
  std::string datetime_slot;
  std::string department;
  std::string status;
  std::string notes;

  a2a::json to_json() const;
};

// Book, view and cancel appointments
class AppointmentBookingHandler : public a2a::CapabilityHandler {
 public:
  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

 private:
  Message book();
  Message view() const;
  Message cancel(const std::string& text);

  mutable std::mutex mutex_;
  std::map<std::string, Appointment> appointments_;
};

// One audited access to patient data
struct AccessLogEntry {
  std::string timestamp;
  std::string action;  // data_access, patient_registration, identity_verification
  std::string patient_id;
  std::string context_id;
  std::string session_id;

  a2a::json to_json() const;
};

// Published on the a2a bus for every audited access
struct PatientDataAccessed {
  AccessLogEntry entry;
};

// Stored form of a securely registered patient. Identifying fields are kept
// only masked for display plus a SHA-256 digest for matching.
struct SecurePatientRecord {
  std::string id;
  std::string name_masked;
  std::string email_masked;
  std::string email_digest;
  std::string dob_masked;
  std::string ssn_masked;
  std::string created_at;

  a2a::json to_json() const;
};

// Registration and identity verification behind a credential gatekeeper.
// Every request is written to the access log.
class SecurePatientHandler : public a2a::CapabilityHandler {
 public:
  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

  std::vector<AccessLogEntry> audit_log() const;

  std::vector<SecurePatientRecord> records() const;

 private:
  Message secure_register(const std::string& text, const HandlerContext& ctx);
  Message verify_identity(const std::string& text, const HandlerContext& ctx);

  void log_access(const std::string& action, const std::string& patient_id, const std::string& context_id);

  mutable std::mutex mutex_;
  std::map<std::string, SecurePatientRecord> records_;
  std::vector<AccessLogEntry> audit_log_;
};

std::string mask_name(const std::string& name);
std::string mask_email(const std::string& email);
std::string mask_ssn(const std::string& ssn);
std::string mask_dob(const std::string& dob);

// Lower-case hex SHA-256
std::string sha256_hex(const std::string& data);

// Long-running analysis reporting each stage through the progress callback
class StreamingAnalysisHandler : public a2a::CapabilityHandler {
 public:
  StreamingAnalysisHandler(std::vector<std::string> stages, std::chrono::milliseconds stage_delay);

  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override;

 private:
  std::vector<std::string> stages_;
  std::chrono::milliseconds stage_delay_;
};

// Built-in defaults for each role: identity, skills, port, pipeline.
// Roles: coordinator, patient, doctor, booking, analysis, secure-patient.
std::optional<a2a::Config> default_config(const std::string& role);

// Handler for a role; nullptr for an unknown role
a2a::CapabilityHandlerPtr make_handler(const std::string& role, const a2a::Config& config, a2a::DownstreamCallerPtr caller);

}  // namespace hospital
